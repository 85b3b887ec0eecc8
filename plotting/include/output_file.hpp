#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace plotting {

    // Writes to "<target>.partial" and renames onto the target in commit().
    // If the object is destroyed without a successful commit, the partial file is
    // removed, so a failed render never leaves a file at the target path.
    class ScopedOutputFile {
    public:
        explicit ScopedOutputFile(std::filesystem::path target);
        ~ScopedOutputFile();

        ScopedOutputFile(const ScopedOutputFile&) = delete;
        ScopedOutputFile& operator=(const ScopedOutputFile&) = delete;

        std::ofstream& stream() { return stream_; }

        // Flushes, closes and moves the file into place. Throws core::RenderException.
        void commit();

        const std::filesystem::path& target() const { return target_; }
        const std::filesystem::path& partialPath() const { return partial_; }
        bool committed() const { return committed_; }

    private:
        std::filesystem::path target_;
        std::filesystem::path partial_;
        std::ofstream stream_;
        bool committed_ = false;
    };

    // Writes `content` to `target` through a ScopedOutputFile
    void writeFileAtomically(const std::filesystem::path& target, const std::string& content);

} // namespace plotting
