/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "file_state.hpp"
#include "core/logger.hpp"

namespace dolly::states {

    FileState::FileState(io::ITrackStore& store, const track::SpeedRange speeds)
        : store_(store),
          speeds_(speeds),
          files_(store.list()) {
        selectNewFile();
        LOG_INFO("There are currently {} track states available", files_.size());
    }

    std::string FileState::selectedLabel() const {
        return newFileSelected() ? std::string(NEW_FILE_LABEL) : files_[selected_].string();
    }

    void FileState::save(const track::TrackRegistry& registry) {
        const auto data = registry.makeSaveData();
        if (newFileSelected()) {
            const auto path = store_.nextNewPath();
            if (store_.write(path, data)) {
                files_.push_back(path);
            }
        } else if (store_.write(files_[selected_], data)) {
            LOG_INFO("Overwrote {} with the current tracks", files_[selected_].string());
        }
        selectNewFile();
    }

    void FileState::load(track::TrackRegistry& registry) {
        const auto& path = files_[selected_];
        if (!store_.exists(path)) {
            LOG_DEBUG("Skipping load, {} no longer exists", path.string());
            return;
        }
        const auto data = store_.read(path);
        registry.loadSaveData(data, speeds_);
        LOG_INFO("Loaded {} as the current state ({} track pairs)", path.string(), registry.size());
    }

    void FileState::removeSelected() {
        const auto path = files_[selected_];
        if (store_.remove(path) || !store_.exists(path)) {
            files_.erase(files_.begin() + static_cast<ptrdiff_t>(selected_));
        }
        selectNewFile();
    }

    void FileState::cycle(const float direction) {
        const size_t count = files_.size() + 1;
        if (direction > 0.0f) {
            selected_ = (selected_ + 1) % count;
        } else {
            selected_ = (selected_ + count - 1) % count;
        }
    }

    StateId FileState::update(TickContext& ctx) {
        if (ctx.dominant.primary_down) {
            save(ctx.registry);
        }
        if (ctx.dominant.secondary_down && !newFileSelected()) {
            load(ctx.registry);
        }
        if (ctx.recessive.secondary_down && !newFileSelected()) {
            removeSelected();
        }
        if (ctx.dominant.axis_down && ctx.dominant.axis.y != 0.0f) {
            cycle(ctx.dominant.axis.y);
        }

        if (const auto next = pollMenu(ctx); next && *next != id()) {
            ctx.feedback.setDominant("");
            selectNewFile();
            return *next;
        }
        ctx.feedback.setDominant(selectedLabel());
        return id();
    }

} // namespace dolly::states
