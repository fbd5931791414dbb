/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <queue>
#include <vector>

namespace oppool::op_pool {

  /**
   * Candidate of the maximum coverage selection.
   * `score` is the size of the covering set. `updateCoveringSet` removes
   * what a selected item covers from this candidate's covering set.
   */
  template <typename T>
  concept MaxCover = requires(T item,
                              const T &const_item,
                              const typename T::Object &object,
                              const typename T::CoveringSet &covering_set) {
    { const_item.object() } -> std::same_as<const typename T::Object &>;
    {
      const_item.coveringSet()
    } -> std::same_as<const typename T::CoveringSet &>;
    item.updateCoveringSet(object, covering_set);
    { const_item.score() } -> std::convertible_to<size_t>;
  };

  /**
   * Greedy maximum coverage with lazy re-evaluation.
   *
   * Candidates are ordered by last known score, ties by original position.
   * Scores only decrease as items get selected, so a candidate whose score is
   * unchanged after applying all selections made since its last evaluation
   * is the best one. Otherwise it is queued again with the fresh score.
   * Items with zero score are never selected.
   *
   * @returns at most `limit` objects ordered by non-increasing marginal gain
   */
  template <MaxCover Item>
  std::vector<typename Item::Object> maximumCover(std::vector<Item> items,
                                                  size_t limit) {
    struct Candidate {
      size_t score;
      size_t position;
      /// Number of selections already applied to the covering set
      size_t applied;

      bool operator<(const Candidate &other) const {
        if (score != other.score) {
          return score < other.score;
        }
        return position > other.position;
      }
    };

    std::priority_queue<Candidate> queue;
    for (size_t position = 0; position < items.size(); ++position) {
      auto score = items[position].score();
      if (score != 0) {
        queue.push({.score = score, .position = position, .applied = 0});
      }
    }

    std::vector<size_t> selected;
    while (selected.size() < limit and not queue.empty()) {
      auto candidate = queue.top();
      queue.pop();

      auto &item = items[candidate.position];
      for (; candidate.applied < selected.size(); ++candidate.applied) {
        auto &best = items[selected[candidate.applied]];
        item.updateCoveringSet(best.object(), best.coveringSet());
      }

      auto score = item.score();
      if (score == 0) {
        continue;
      }
      if (score == candidate.score) {
        selected.emplace_back(candidate.position);
      } else {
        candidate.score = score;
        queue.push(candidate);
      }
    }

    std::vector<typename Item::Object> result;
    result.reserve(selected.size());
    for (auto position : selected) {
      result.emplace_back(items[position].object());
    }
    return result;
  }

}  // namespace oppool::op_pool
