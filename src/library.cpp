#include "headers/library.hpp"
#include <algorithm>
#include <cctype>

namespace {

    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    bool isPlainName(const std::string& name) {
        if (name.empty() || name == "." || name == "..") {
            return false;
        }
        return name.find_first_of("/\\") == std::string::npos && name.find('\0') == std::string::npos;
    }

}

AudioReader::AudioReader(const fs::path& path)
    : file_(path.string(), std::ios::binary) {
    boost::system::error_code ec;
    auto size = fs::file_size(path, ec);
    if (!ec) {
        size_ = size;
    }
}

ReadStatus AudioReader::readChunk(std::string& chunk, std::size_t max_bytes) {
    if (file_.bad()) {
        return ReadStatus::Error;
    }

    chunk.resize(max_bytes);
    file_.read(&chunk[0], static_cast<std::streamsize>(max_bytes));
    std::streamsize n = file_.gcount();

    if (n > 0) {
        chunk.resize(static_cast<std::size_t>(n));
        return ReadStatus::Data;
    }
    chunk.clear();
    if (file_.bad() || !file_.eof()) {
        return ReadStatus::Error;
    }
    return ReadStatus::End;
}

AudioLibrary::AudioLibrary(fs::path root, std::vector<std::string> extensions)
    : root_(std::move(root)) {
    for (auto& ext : extensions) {
        extensions_.push_back(toLower(ext));
    }
}

bool AudioLibrary::isAudioFile(const fs::path& path) const {
    std::string ext = toLower(path.extension().string());
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

std::vector<std::string> AudioLibrary::list() const {
    std::vector<std::string> names;
    for (fs::directory_iterator it(root_), end; it != end; ++it) {
        if (fs::is_directory(it->status())) continue;
        if (isAudioFile(it->path())) {
            names.push_back(it->path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<AudioEntry> AudioLibrary::describe(const std::string& url_prefix) const {
    std::vector<AudioEntry> entries;
    for (const auto& name : list()) {
        boost::system::error_code ec;
        auto size = fs::file_size(root_ / name, ec);
        if (ec) {
            // Removed between listing and stat.
            continue;
        }

        AudioEntry entry;
        entry.name = name;
        entry.path = url_prefix + name;
        entry.size = size;
        entry.duration = durationFromFilename(name);
        entries.push_back(std::move(entry));
    }
    return entries;
}

boost::optional<fs::path> AudioLibrary::resolve(const std::string& name) const {
    if (!isPlainName(name)) {
        return boost::none;
    }

    fs::path path = root_ / name;
    boost::system::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return boost::none;
    }
    return path;
}

std::unique_ptr<AudioReader> AudioLibrary::open(const fs::path& path) const {
    return std::make_unique<AudioReader>(path);
}

int durationFromFilename(const std::string& filename) {
    auto dash = filename.rfind('-');
    if (dash == std::string::npos) {
        return 0;
    }

    std::string part = filename.substr(dash + 1);
    const std::string suffix = "s.mp3";
    if (part.size() >= suffix.size() &&
        part.compare(part.size() - suffix.size(), suffix.size(), suffix) == 0) {
        part.erase(part.size() - suffix.size());
    }

    std::size_t digits = 0;
    while (digits < part.size() && std::isdigit(static_cast<unsigned char>(part[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return 0;
    }
    try {
        return std::stoi(part.substr(0, digits));
    }
    catch (const std::out_of_range&) {
        return 0;
    }
}
