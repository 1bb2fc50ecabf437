#pragma once

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = boost::filesystem;

struct AudioEntry {
    std::string name;
    std::string path;
    std::uintmax_t size = 0;
    int duration = 0;
};

enum class ReadStatus { Data, End, Error };

// Sequential chunk reader over one resource file.
class AudioReader {
public:
    explicit AudioReader(const fs::path& path);
    virtual ~AudioReader() = default;

    bool isOpen() const { return file_.is_open(); }
    std::uintmax_t size() const { return size_; }

    // Replaces chunk with up to max_bytes of the next bytes of the file.
    virtual ReadStatus readChunk(std::string& chunk, std::size_t max_bytes);

private:
    std::ifstream file_;
    std::uintmax_t size_ = 0;
};

class AudioLibrary {
public:
    explicit AudioLibrary(fs::path root,
        std::vector<std::string> extensions = { ".mp3", ".wav" });
    virtual ~AudioLibrary() = default;

    const fs::path& root() const { return root_; }

    // Names of the playable files, sorted. Throws fs::filesystem_error when
    // the directory cannot be read.
    std::vector<std::string> list() const;
    std::vector<AudioEntry> describe(const std::string& url_prefix) const;

    // Maps a plain file name to an existing regular file inside the library.
    boost::optional<fs::path> resolve(const std::string& name) const;

    // The reader reports isOpen() == false when the file cannot be opened.
    virtual std::unique_ptr<AudioReader> open(const fs::path& path) const;

private:
    bool isAudioFile(const fs::path& path) const;

    fs::path root_;
    std::vector<std::string> extensions_;
};

// "sample-003s.mp3" -> 3; 0 when the name does not follow that pattern.
int durationFromFilename(const std::string& filename);
