/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "track/save_state.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

namespace dolly::io {

    inline constexpr std::string_view SAVE_FILE_PREFIX = "track_state_";
    inline constexpr std::string_view SAVE_FILE_EXTENSION = ".json";

    // Named store of saved track pair lists
    class ITrackStore {
    public:
        virtual ~ITrackStore() = default;

        // Existing save files in a stable order
        [[nodiscard]] virtual std::vector<std::filesystem::path> list() const = 0;
        // Throws on unreadable or malformed data
        [[nodiscard]] virtual track::SaveData read(const std::filesystem::path& path) const = 0;
        virtual bool write(const std::filesystem::path& path, const track::SaveData& data) = 0;
        virtual bool remove(const std::filesystem::path& path) = 0;
        [[nodiscard]] virtual bool exists(const std::filesystem::path& path) const = 0;
        // Unused path for a new save file
        [[nodiscard]] virtual std::filesystem::path nextNewPath() const = 0;
    };

    // Stores each save as track_state_<n>.json inside one directory
    class JsonTrackStore final : public ITrackStore {
    public:
        explicit JsonTrackStore(std::filesystem::path directory);

        [[nodiscard]] std::vector<std::filesystem::path> list() const override;
        [[nodiscard]] track::SaveData read(const std::filesystem::path& path) const override;
        bool write(const std::filesystem::path& path, const track::SaveData& data) override;
        bool remove(const std::filesystem::path& path) override;
        [[nodiscard]] bool exists(const std::filesystem::path& path) const override;
        [[nodiscard]] std::filesystem::path nextNewPath() const override;

        [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

    private:
        std::filesystem::path directory_;
    };

} // namespace dolly::io
