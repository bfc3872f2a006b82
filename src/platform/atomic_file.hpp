#pragma once

#include <string>
#include <filesystem>

// Crash-safe replacement of a single file.
//
// The content goes to a temporary file created next to the target (same
// directory, hence same filesystem), is fsynced, and only then renamed over
// the target. Readers see either the old or the new content, never a mix.
// If the object is destroyed before commit() the temporary file is removed
// and the target is left untouched.
//
//   AtomicFile f(path);
//   f.write(data);
//   f.commit();
class AtomicFile {
public:
    // Creates the temporary file. Throws filesystem_error on failure.
    explicit AtomicFile(std::filesystem::path target);
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    // Appends to the temporary file.
    void write(const std::string& data);

    // fsync, close, rename over the target, fsync the directory.
    // On failure the temporary file is removed and the target is unchanged.
    void commit();

    bool committed() const { return committed_; }
    const std::filesystem::path& target() const { return target_; }
    const std::filesystem::path& temp_path() const { return temp_path_; }

private:
    void discard() noexcept;

    std::filesystem::path target_;
    std::filesystem::path temp_path_;
    int fd_ = -1;
    bool committed_ = false;
};

// Atomically replaces target with content, adding a trailing newline when
// content is non-empty. The only sanctioned way to write a store entry.
void write_text_atomic(const std::filesystem::path& target, const std::string& content);
