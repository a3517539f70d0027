/**
 * @file depth_recovery.cpp
 * @brief Реализация исправления глубин
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "depth_recovery.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace strata::core {

namespace {

constexpr double kOutlierFactor = 2.0;

struct Entry {
    double depth = 0.0;
    std::optional<std::string> material;
    std::optional<std::string> color;
};

bool hasError(const ValidationResult& validation, ValidationErrorType type) {
    return std::any_of(validation.errors.begin(), validation.errors.end(),
        [type](const ValidationError& e) { return e.type == type; });
}

bool hasWarning(const ValidationResult& validation, ErrorCode code) {
    return std::any_of(validation.warnings.begin(), validation.warnings.end(),
        [code](const ValidationWarning& w) { return w.code == code; });
}

std::vector<Entry> toEntries(const RawExtraction& raw) {
    std::vector<Entry> entries;
    entries.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        Entry e;
        e.depth = raw.depths[i];
        if (i < raw.materials.size()) e.material = raw.materials[i];
        if (i < raw.colors.size()) e.color = raw.colors[i];
        entries.push_back(std::move(e));
    }
    return entries;
}

// Нечисловая глубина -> середина между ближайшими числовыми соседями
void interpolateMissing(std::vector<Entry>& entries, DepthRecovery& report) {
    const std::vector<Entry> source = entries;
    std::vector<Entry> filled;
    filled.reserve(source.size());

    for (size_t i = 0; i < source.size(); ++i) {
        if (std::isfinite(source[i].depth)) {
            filled.push_back(source[i]);
            continue;
        }

        std::optional<double> prev;
        for (size_t j = i; j-- > 0;) {
            if (std::isfinite(source[j].depth)) { prev = source[j].depth; break; }
        }
        std::optional<double> next;
        for (size_t j = i + 1; j < source.size(); ++j) {
            if (std::isfinite(source[j].depth)) { next = source[j].depth; break; }
        }

        if (prev.has_value() && next.has_value()) {
            Entry e = source[i];
            e.depth = (*prev + *next) / 2.0;
            filled.push_back(std::move(e));
            ++report.interpolated;
        } else {
            ++report.dropped;
        }
    }
    entries = std::move(filled);
}

// Сортировка и удаление глубин больше двух медиан
bool removeOutliers(std::vector<Entry>& entries, DepthRecovery& report) {
    const bool sorted = std::is_sorted(entries.begin(), entries.end(),
        [](const Entry& a, const Entry& b) { return a.depth < b.depth; });
    std::stable_sort(entries.begin(), entries.end(),
        [](const Entry& a, const Entry& b) { return a.depth < b.depth; });

    if (entries.empty()) {
        return !sorted;
    }
    const double median = entries[entries.size() / 2].depth;
    if (median > 0.0) {
        const double threshold = median * kOutlierFactor;
        const auto before = entries.size();
        entries.erase(std::remove_if(entries.begin(), entries.end(),
            [threshold](const Entry& e) { return e.depth > threshold; }), entries.end());
        report.outliers_removed += before - entries.size();
    }
    return !sorted;
}

void removeDuplicates(std::vector<Entry>& entries, DepthRecovery& report) {
    std::set<double> seen;
    std::vector<Entry> unique;
    unique.reserve(entries.size());
    for (auto& e : entries) {
        if (seen.insert(e.depth).second) {
            unique.push_back(std::move(e));
        } else {
            ++report.duplicates_removed;
        }
    }
    entries = std::move(unique);
}

} // anonymous namespace

bool needsDepthRecovery(const ValidationResult& validation) noexcept {
    return hasError(validation, ValidationErrorType::NonNumericDepth) ||
           hasWarning(validation, ErrorCode::InconsistentDepthDirection) ||
           hasWarning(validation, ErrorCode::DuplicateDepth);
}

DepthRecovery recoverDepthSequence(const RawExtraction& raw, const ValidationResult& validation) {
    DepthRecovery report;
    report.data = raw;

    auto entries = toEntries(raw);
    bool reordered = false;

    if (hasError(validation, ValidationErrorType::NonNumericDepth)) {
        interpolateMissing(entries, report);
    }
    if (hasWarning(validation, ErrorCode::InconsistentDepthDirection)) {
        reordered = removeOutliers(entries, report);
    }
    if (hasWarning(validation, ErrorCode::DuplicateDepth)) {
        removeDuplicates(entries, report);
    }

    report.applied = reordered || report.interpolated > 0 || report.dropped > 0 ||
                     report.outliers_removed > 0 || report.duplicates_removed > 0;
    if (!report.applied) {
        return report;
    }

    report.data.depths.clear();
    report.data.materials.clear();
    report.data.colors.clear();
    for (auto& e : entries) {
        report.data.addPoint(e.depth, std::move(e.material), std::move(e.color));
    }
    return report;
}

} // namespace strata::core
