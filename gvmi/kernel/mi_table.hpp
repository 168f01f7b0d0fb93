#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/error.hpp"
#include "gvmi/core/macros.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// =============================================================================
// FILE: gvmi/kernel/mi_table.hpp
// BRIEF: Symmetric gene x gene table of mutual information scores
// =============================================================================

namespace gvmi::kernel::mi {

// Dense n x n row-major storage, rows and columns in label order.
// Label lookups resolve to the LAST row carrying that label.
class MITable {
public:
    using NestedMap = std::map<std::string, std::map<std::string, Real>>;

    MITable() = default;

    explicit MITable(std::vector<std::string> labels)
        : labels_(std::move(labels)),
          values_(labels_.size() * labels_.size(), Real(0)) {
        index_.reserve(labels_.size());
        for (Size i = 0; i < labels_.size(); ++i) {
            if (!index_.insert_or_assign(labels_[i], i).second) {
                has_duplicates_ = true;
            }
        }
    }

    MITable(const MITable&) = default;
    MITable& operator=(const MITable&) = default;
    MITable(MITable&&) noexcept = default;
    MITable& operator=(MITable&&) noexcept = default;
    ~MITable() = default;

    [[nodiscard]] Size size() const noexcept { return labels_.size(); }
    [[nodiscard]] bool empty() const noexcept { return labels_.empty(); }

    [[nodiscard]] const std::vector<std::string>& labels() const noexcept { return labels_; }

    [[nodiscard]] const std::string& label(Size i) const {
        check_index(i);
        return labels_[i];
    }

    [[nodiscard]] bool contains(const std::string& label) const {
        return index_.find(label) != index_.end();
    }

    // Throws LabelNotFoundError
    [[nodiscard]] Size index_of(const std::string& label) const {
        auto it = index_.find(label);
        if (GVMI_UNLIKELY(it == index_.end())) {
            throw LabelNotFoundError(label);
        }
        return it->second;
    }

    [[nodiscard]] Real at(Size i, Size j) const {
        check_index(i);
        check_index(j);
        return values_[i * size() + j];
    }

    [[nodiscard]] Real at(const std::string& a, const std::string& b) const {
        return values_[index_of(a) * size() + index_of(b)];
    }

    // Writes both (i, j) and (j, i)
    void set(Size i, Size j, Real value) {
        check_index(i);
        check_index(j);
        const Size n = size();
        values_[i * n + j] = value;
        values_[j * n + i] = value;
    }

    [[nodiscard]] Array<const Real> row(Size i) const {
        check_index(i);
        return Array<const Real>(values_.data() + i * size(), size());
    }

    [[nodiscard]] Array<const Real> data() const noexcept { return as_array(values_); }
    [[nodiscard]] Array<Real> data() noexcept { return as_array(values_); }

    [[nodiscard]] bool has_duplicate_labels() const noexcept { return has_duplicates_; }

    // label -> label -> score; with duplicate labels later rows overwrite earlier ones
    [[nodiscard]] NestedMap to_nested_map() const {
        NestedMap out;
        const Size n = size();
        for (Size i = 0; i < n; ++i) {
            auto& inner = out[labels_[i]];
            for (Size j = 0; j < n; ++j) {
                inner[labels_[j]] = values_[i * n + j];
            }
        }
        return out;
    }

private:
    void check_index(Size i) const {
        if (GVMI_UNLIKELY(i >= labels_.size())) {
            throw IndexOutOfBoundsError("MITable: index " + std::to_string(i) +
                                        " out of range for " +
                                        std::to_string(labels_.size()) + " genes");
        }
    }

    std::vector<std::string> labels_;
    std::vector<Real> values_;
    std::unordered_map<std::string, Size> index_;
    bool has_duplicates_ = false;
};

} // namespace gvmi::kernel::mi
