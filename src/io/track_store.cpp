/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "track_store.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace dolly::io {

    namespace fs = std::filesystem;

    namespace {
        constexpr int JSON_INDENT = 2;

        // n from track_state_<n>.json, nullopt for any other file name
        std::optional<int> saveFileNumber(const fs::path& path) {
            if (path.extension() != SAVE_FILE_EXTENSION) return std::nullopt;
            const std::string stem = path.stem().string();
            if (!stem.starts_with(SAVE_FILE_PREFIX)) return std::nullopt;

            const std::string_view digits = std::string_view(stem).substr(SAVE_FILE_PREFIX.size());
            int n = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
            return n;
        }

        fs::path savePath(const fs::path& directory, const int n) {
            return directory / std::format("{}{}{}", SAVE_FILE_PREFIX, n, SAVE_FILE_EXTENSION);
        }
    } // namespace

    JsonTrackStore::JsonTrackStore(fs::path directory)
        : directory_(std::move(directory)) {}

    std::vector<fs::path> JsonTrackStore::list() const {
        std::vector<std::pair<int, fs::path>> numbered;
        std::error_code ec;
        if (!fs::is_directory(directory_, ec)) {
            return {};
        }
        fs::directory_iterator it(directory_, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec)) continue;
            if (const auto n = saveFileNumber(it->path())) {
                numbered.emplace_back(*n, it->path());
            }
        }
        if (ec) {
            LOG_WARN("Failed to list save directory {}: {}", directory_.string(), ec.message());
        }

        std::sort(numbered.begin(), numbered.end());
        std::vector<fs::path> paths;
        paths.reserve(numbered.size());
        for (auto& [n, path] : numbered) {
            paths.push_back(std::move(path));
        }
        return paths;
    }

    track::SaveData JsonTrackStore::read(const fs::path& path) const {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error(std::format("Failed to open save file: {}", path.string()));
        }
        const auto j = nlohmann::json::parse(file);
        return track::saveDataFromJson(j);
    }

    bool JsonTrackStore::write(const fs::path& path, const track::SaveData& data) {
        std::error_code ec;
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                LOG_ERROR("Failed to create save directory {}: {}", path.parent_path().string(), ec.message());
                return false;
            }
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open save file for writing: {}", path.string());
            return false;
        }
        file << track::toJson(data).dump(JSON_INDENT);
        if (!file) {
            LOG_ERROR("Failed to write save file: {}", path.string());
            return false;
        }
        LOG_INFO("Saved {} track pairs to {}", data.position_tracks.size(), path.string());
        return true;
    }

    bool JsonTrackStore::remove(const fs::path& path) {
        std::error_code ec;
        if (!fs::remove(path, ec)) {
            if (ec) {
                LOG_ERROR("Failed to delete {}: {}", path.string(), ec.message());
            } else {
                LOG_WARN("Nothing to delete at {}", path.string());
            }
            return false;
        }
        LOG_INFO("Deleted save file {}", path.string());
        return true;
    }

    bool JsonTrackStore::exists(const fs::path& path) const {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    fs::path JsonTrackStore::nextNewPath() const {
        int n = static_cast<int>(list().size()) + 1;
        while (exists(savePath(directory_, n))) {
            ++n;
        }
        return savePath(directory_, n);
    }

} // namespace dolly::io
