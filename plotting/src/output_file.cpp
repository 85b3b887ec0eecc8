#include "output_file.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace plotting {

    ScopedOutputFile::ScopedOutputFile(fs::path target)
        : target_(std::move(target))
    {
        partial_ = target_;
        partial_ += ".partial";

        if (target_.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(target_.parent_path(), ec);
            if (ec) {
                throw core::RenderException(fmt::format("Cannot create output directory '{}': {}",
                                                        target_.parent_path().string(), ec.message()));
            }
        }

        stream_.open(partial_, std::ios::out | std::ios::trunc);
        if (!stream_.is_open()) {
            throw core::RenderException(fmt::format("Cannot open '{}' for writing", partial_.string()));
        }
    }

    ScopedOutputFile::~ScopedOutputFile() {
        if (committed_) {
            return;
        }
        if (stream_.is_open()) {
            stream_.close();
        }
        std::error_code ec;
        fs::remove(partial_, ec);
        if (ec) {
            try {
                core::logging::getLogger()->warn("Could not remove partial output '{}': {}", partial_.string(), ec.message());
            } catch (const std::exception&) {
                // Logging not initialized; nothing else to report from a destructor
            }
        }
    }

    void ScopedOutputFile::commit() {
        stream_.flush();
        if (!stream_) {
            throw core::RenderException(fmt::format("Failed while writing '{}'", partial_.string()));
        }
        stream_.close();
        if (stream_.fail()) {
            throw core::RenderException(fmt::format("Failed to close '{}'", partial_.string()));
        }

        std::error_code ec;
        fs::rename(partial_, target_, ec);
        if (ec) {
            throw core::RenderException(fmt::format("Failed to move '{}' to '{}': {}",
                                                    partial_.string(), target_.string(), ec.message()));
        }
        committed_ = true;
        core::logging::getLogger()->debug("Wrote {}", target_.string());
    }

    void writeFileAtomically(const fs::path& target, const std::string& content) {
        ScopedOutputFile file(target);
        file.stream() << content;
        file.commit();
    }

} // namespace plotting
