/* SPDX-FileCopyrightText: 2025 Dolly Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "edit_state.hpp"
#include "core/logger.hpp"

namespace dolly::states {

    using input::Hand;
    using track::TrackRole;

    namespace {
        constexpr Hand HANDS[] = {Hand::DOMINANT, Hand::RECESSIVE};

        [[nodiscard]] Hand otherHand(const Hand hand) {
            return hand == Hand::DOMINANT ? Hand::RECESSIVE : Hand::DOMINANT;
        }
    } // namespace

    EditState::EditState(const float selection_radius, const float adjustment_sensitivity)
        : selection_radius_(selection_radius),
          adjustment_sensitivity_(adjustment_sensitivity) {}

    std::optional<Selection> EditState::findControlPoint(const track::TrackRegistry& registry,
                                                         const glm::vec3& probe) const {
        for (const TrackRole role : {TrackRole::POSITION, TrackRole::LOOK}) {
            for (size_t p = 0; p < registry.size(); ++p) {
                const auto points = registry.at(p).track(role).controlPoints();
                for (size_t i = 0; i < points.size(); ++i) {
                    if (glm::distance(points[i], probe) <= selection_radius_) {
                        return Selection{p, role, SelectionKind::CONTROL_POINT, i};
                    }
                }
            }
        }
        return std::nullopt;
    }

    std::optional<Selection> EditState::findCheckpoint(const track::TrackRegistry& registry,
                                                       const glm::vec3& probe) const {
        for (size_t p = 0; p < registry.size(); ++p) {
            const auto& track = registry.at(p).position();
            for (size_t i = 0; i < track.checkpointCount(); ++i) {
                if (glm::distance(track.positionAt(track.checkpointT(i)), probe) <= selection_radius_) {
                    return Selection{p, TrackRole::POSITION, SelectionKind::CHECKPOINT, i};
                }
            }
        }
        return std::nullopt;
    }

    void EditState::grab(const Hand hand, const Selection& selection) {
        held(hand) = selection;
        auto& other = held(otherHand(hand));
        if (other && *other == selection) {
            LOG_DEBUG("{} hand took over a point from the {} hand",
                      input::handName(hand), input::handName(otherHand(hand)));
            other.reset();
        }
        LOG_TRACE("{} hand selected {} {} of pair {}", input::handName(hand),
                  selection.kind == SelectionKind::CHECKPOINT ? "checkpoint" : "control point",
                  selection.index, selection.pair);
    }

    void EditState::trySelect(const Hand hand, const input::HandInput& in, const track::TrackRegistry& registry) {
        std::optional<Selection> found;
        if (in.trigger_button) {
            found = findControlPoint(registry, in.probe);
        } else if (in.grip_button) {
            found = findCheckpoint(registry, in.probe);
        }
        if (found) {
            grab(hand, *found);
        }
    }

    void EditState::hold(const Hand hand, const input::HandInput& in, TickContext& ctx) {
        auto& selection = held(hand);
        auto& pair = ctx.registry.at(selection->pair);

        if (selection->kind == SelectionKind::CHECKPOINT) {
            if (!in.grip_button) {
                selection.reset();
                return;
            }
            const float t = pair.position().closestParameter(in.probe);
            const int moved = pair.moveCheckpoint(static_cast<int>(selection->index), t);
            if (moved >= 0 && static_cast<size_t>(moved) != selection->index) {
                onCheckpointRemoved(selection->pair, selection->index, hand);
                onCheckpointInserted(selection->pair, static_cast<size_t>(moved), hand);
                selection->index = static_cast<size_t>(moved);
            }
            if (in.axis.y != 0.0f) {
                const float speed = pair.position().checkpointSpeed(selection->index) +
                                    in.axis.y * adjustment_sensitivity_ * ctx.dt;
                pair.setCheckpointSpeed(selection->index, speed);
            }
            pair.refresh();
            return;
        }

        if (!in.trigger_button) {
            selection.reset();
            return;
        }
        auto& track = pair.track(selection->role);
        track.moveControlPoint(selection->index, in.probe);
        track.refresh();
    }

    void EditState::dominantActions(TickContext& ctx) {
        const auto& selection = held(Hand::DOMINANT);
        if (!selection) return;
        const Selection sel = *selection;
        auto& pair = ctx.registry.at(sel.pair);

        if (ctx.dominant.primary_down) {
            auto& track = pair.track(sel.role);
            const auto points = track.controlPoints();
            const glm::vec3 midpoint = (points[points.size() - 1] + points[points.size() - 2]) * 0.5f;
            const size_t index = track.addControlPoint(midpoint);
            onControlPointInserted(sel.pair, sel.role, index);
            track.refresh();
            LOG_DEBUG("Added control point {} to pair {}", index, sel.pair);
        } else if (ctx.dominant.secondary_down && sel.role == TrackRole::POSITION) {
            const size_t index = pair.addCheckpoint(0.5f);
            onCheckpointInserted(sel.pair, index);
            pair.refresh();
            LOG_DEBUG("Added checkpoint {} to pair {}", index, sel.pair);
        }
    }

    void EditState::recessiveActions(TickContext& ctx) {
        auto& selection = held(Hand::RECESSIVE);
        if (!selection) return;
        const Selection sel = *selection;

        if (ctx.recessive.primary_down) {
            auto& pair = ctx.registry.at(sel.pair);
            if (sel.kind == SelectionKind::CHECKPOINT) {
                if (pair.deleteCheckpoint(sel.index)) {
                    onCheckpointRemoved(sel.pair, sel.index, Hand::RECESSIVE);
                }
                pair.refresh();
            } else {
                auto& track = pair.track(sel.role);
                if (track.deleteControlPoint(sel.index)) {
                    onControlPointRemoved(sel.pair, sel.role, sel.index, Hand::RECESSIVE);
                }
                track.refresh();
            }
            selection.reset();
        } else if (ctx.recessive.secondary_down) {
            if (ctx.registry.remove(sel.pair)) {
                LOG_INFO("Deleted track pair {}", sel.pair + 1);
            }
            onPairRemoved(sel.pair);
        }
    }

    void EditState::onControlPointInserted(const size_t pair, const TrackRole role, const size_t index,
                                           const std::optional<Hand> except) {
        for (const Hand hand : HANDS) {
            auto& sel = held(hand);
            if (hand == except || !sel) continue;
            if (sel->pair == pair && sel->role == role && sel->kind == SelectionKind::CONTROL_POINT &&
                sel->index >= index) {
                ++sel->index;
            }
        }
    }

    void EditState::onControlPointRemoved(const size_t pair, const TrackRole role, const size_t index,
                                          const std::optional<Hand> except) {
        for (const Hand hand : HANDS) {
            auto& sel = held(hand);
            if (hand == except || !sel) continue;
            if (sel->pair != pair || sel->role != role || sel->kind != SelectionKind::CONTROL_POINT) continue;
            if (sel->index == index) {
                sel.reset();
            } else if (sel->index > index) {
                --sel->index;
            }
        }
    }

    void EditState::onCheckpointInserted(const size_t pair, const size_t index, const std::optional<Hand> except) {
        for (const Hand hand : HANDS) {
            auto& sel = held(hand);
            if (hand == except || !sel) continue;
            if (sel->pair == pair && sel->kind == SelectionKind::CHECKPOINT && sel->index >= index) {
                ++sel->index;
            }
        }
    }

    void EditState::onCheckpointRemoved(const size_t pair, const size_t index, const std::optional<Hand> except) {
        for (const Hand hand : HANDS) {
            auto& sel = held(hand);
            if (hand == except || !sel) continue;
            if (sel->pair != pair || sel->kind != SelectionKind::CHECKPOINT) continue;
            if (sel->index == index) {
                sel.reset();
            } else if (sel->index > index) {
                --sel->index;
            }
        }
    }

    void EditState::onPairRemoved(const size_t pair) {
        for (auto& sel : held_) {
            if (!sel) continue;
            if (sel->pair == pair) {
                sel.reset();
            } else if (sel->pair > pair) {
                --sel->pair;
            }
        }
    }

    void EditState::clearSelections() {
        for (auto& sel : held_) {
            sel.reset();
        }
    }

    StateId EditState::update(TickContext& ctx) {
        if (held(Hand::DOMINANT)) {
            hold(Hand::DOMINANT, ctx.dominant, ctx);
        } else {
            trySelect(Hand::DOMINANT, ctx.dominant, ctx.registry);
        }
        dominantActions(ctx);

        if (held(Hand::RECESSIVE)) {
            hold(Hand::RECESSIVE, ctx.recessive, ctx);
        } else {
            trySelect(Hand::RECESSIVE, ctx.recessive, ctx.registry);
        }
        recessiveActions(ctx);

        if (const auto next = pollMenu(ctx)) {
            if (*next != id()) {
                clearSelections();
            }
            return *next;
        }
        return id();
    }

} // namespace dolly::states
