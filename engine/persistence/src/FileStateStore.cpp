#include "rummi/persistence/FileStateStore.hpp"

#include <SDL2/SDL.h>

#include <fstream>

namespace rummi::persistence {

namespace {

constexpr const char* kRecordExtension = ".bin";

std::filesystem::path DefaultSaveRoot() {
    std::filesystem::path base;
    if (char* pref = SDL_GetPrefPath("RUMMI", "Server")) {
        base = pref;
        SDL_free(pref);
    }
    if (base.empty()) {
        base = std::filesystem::current_path() / "games";
    }
    return base;
}

std::filesystem::path NormalizeFilename(const std::string& name) {
    std::filesystem::path path{name};
    return path.filename();
}

}  // namespace

FileStateStore::FileStateStore(std::filesystem::path root)
    : root_(root.empty() ? DefaultSaveRoot() : std::move(root)) {}

bool FileStateStore::Initialize() {
    return EnsureRootExists();
}

bool FileStateStore::EnsureRootExists() const {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        return true;
    }
    if (!std::filesystem::create_directories(root_, ec)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot create save root %s: %s",
                     root_.string().c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

std::filesystem::path FileStateStore::ResolvePath(const std::string& game_id) const {
    auto safe = NormalizeFilename(game_id);
    return root_ / safe.replace_extension(kRecordExtension);
}

bool FileStateStore::Save(const std::string& game_id, const std::vector<std::uint8_t>& bytes) {
    if (game_id.empty() || !EnsureRootExists()) {
        return false;
    }
    // Write beside the record and rename so a crash never leaves a torn file.
    const std::filesystem::path path = ResolvePath(game_id);
    std::filesystem::path staging = path;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out.good()) {
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot replace %s: %s", path.string().c_str(),
                     ec.message().c_str());
        return false;
    }
    return true;
}

bool FileStateStore::Load(const std::string& game_id, std::vector<std::uint8_t>& out_bytes) const {
    std::ifstream in(ResolvePath(game_id), std::ios::binary);
    if (!in) {
        return false;
    }
    in.seekg(0, std::ios::end);
    std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size < 0) {
        return false;
    }
    out_bytes.resize(static_cast<std::size_t>(size));
    if (size > 0) {
        in.read(reinterpret_cast<char*>(out_bytes.data()), size);
    }
    return in.good();
}

bool FileStateStore::Remove(const std::string& game_id) {
    std::error_code ec;
    return std::filesystem::remove(ResolvePath(game_id), ec);
}

std::vector<std::string> FileStateStore::List() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!std::filesystem::exists(root_, ec)) {
        return ids;
    }
    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension) {
            continue;
        }
        ids.push_back(entry.path().stem().string());
    }
    return ids;
}

}  // namespace rummi::persistence
