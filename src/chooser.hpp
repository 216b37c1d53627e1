#pragma once
#include "rng.hpp"

#include <optional>
#include <utility>
#include <vector>

// Weighted random selection.
//
// Insertion order matters: it fixes which roll maps to which item, so two
// choosers built from the same pushes in the same order draw identically.
template <typename T>
class Chooser {
public:
    using Entry = std::pair<T, int>;

    Chooser() = default;
    explicit Chooser(std::vector<Entry> items) : items_(std::move(items)) {}

    void push(T item, int weight) {
        items_.emplace_back(std::move(item), weight);
    }

    void append(const std::vector<Entry>& items) {
        items_.insert(items_.end(), items.begin(), items.end());
    }

    std::vector<Entry> extract() const { return items_; }

    const std::vector<Entry>& entries() const { return items_; }
    bool empty() const { return items_.empty(); }
    size_t size() const { return items_.size(); }

    // Negative weights count as zero.
    long long totalWeight() const {
        long long total = 0;
        for (const auto& e : items_) {
            if (e.second > 0) total += e.second;
        }
        return total;
    }

    // One draw from the stream when something can be chosen, none otherwise.
    std::optional<T> choose(RNG& rng) const {
        const long long total = totalWeight();
        if (total <= 0) return std::nullopt;

        long long roll = static_cast<long long>(rng.nextU64() % static_cast<unsigned long long>(total));
        for (const auto& e : items_) {
            if (e.second <= 0) continue;
            roll -= e.second;
            if (roll < 0) return e.first;
        }
        return items_.back().first;
    }

private:
    std::vector<Entry> items_;
};
