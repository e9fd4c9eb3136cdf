#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

namespace mediagrab {

namespace {

// owns one libmagic cookie for the duration of a lookup
class MagicHandle {
public:
    MagicHandle() : magic_(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR)) {
        if (magic_ && magic_load(magic_, nullptr) != 0) {
            Logger::log(LogLevel::Warning,
                        std::string("libmagic database not loaded: ") + magic_error(magic_),
                        "mime_detector");
            magic_close(magic_);
            magic_ = nullptr;
        }
    }

    ~MagicHandle() {
        if (magic_) magic_close(magic_);
    }

    MagicHandle(const MagicHandle&) = delete;
    MagicHandle& operator=(const MagicHandle&) = delete;

    [[nodiscard]] magic_t get() const noexcept { return magic_; }

private:
    magic_t magic_;
};

std::string meaningful(const char* mime) {
    if (!mime) return {};
    std::string result(mime);
    if (result == "application/x-empty" || result == "inode/x-empty") return {};
    return result;
}

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path) {
    const MagicHandle magic;
    if (!magic.get()) return {};
    return meaningful(magic_file(magic.get(), path.string().c_str()));
}

std::string MimeDetector::detect_buffer(const std::string_view bytes) {
    if (bytes.empty()) return {};
    const MagicHandle magic;
    if (!magic.get()) return {};
    return meaningful(magic_buffer(magic.get(), bytes.data(), bytes.size()));
}

} // namespace mediagrab
