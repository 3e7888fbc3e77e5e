#include "dataset.h"

#include <cmath>
#include <stdexcept>

namespace dagstat {

Dataset& Dataset::add_column(const std::string& name, const Eigen::VectorXd& values) {
    if (has_column(name)) {
        throw std::invalid_argument("Column '" + name + "' already exists");
    }
    if (!names_.empty() && values.size() != rows_) {
        throw std::invalid_argument(
            "Column '" + name + "' has " + std::to_string(values.size()) +
            " rows, expected " + std::to_string(rows_));
    }
    rows_ = static_cast<int>(values.size());
    index_[name] = names_.size();
    names_.push_back(name);
    columns_.push_back(values);
    return *this;
}

Dataset Dataset::with_column(const std::string& name, const Eigen::VectorXd& values) const {
    Dataset copy = *this;
    auto it = copy.index_.find(name);
    if (it == copy.index_.end()) {
        copy.add_column(name, values);
        return copy;
    }
    if (values.size() != rows_) {
        throw std::invalid_argument("Replacement for column '" + name + "' has wrong length");
    }
    copy.columns_[it->second] = values;
    return copy;
}

const Eigen::VectorXd& Dataset::column(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::out_of_range("Column '" + name + "' not found in dataset");
    }
    return columns_[it->second];
}

std::set<std::string> Dataset::column_set() const {
    return std::set<std::string>(names_.begin(), names_.end());
}

Eigen::MatrixXd Dataset::matrix(const std::vector<std::string>& names) const {
    Eigen::MatrixXd X(rows_, static_cast<int>(names.size()));
    for (size_t j = 0; j < names.size(); ++j) {
        X.col(j) = column(names[j]);
    }
    return X;
}

Dataset Dataset::take_rows(const std::vector<int>& indices) const {
    Dataset out;
    const int m = static_cast<int>(indices.size());
    for (size_t j = 0; j < names_.size(); ++j) {
        Eigen::VectorXd col(m);
        for (int i = 0; i < m; ++i) {
            col(i) = columns_[j](indices[i]);
        }
        out.add_column(names_[j], col);
    }
    return out;
}

Dataset Dataset::complete_rows(const std::vector<std::string>& names) const {
    std::vector<const Eigen::VectorXd*> used;
    used.reserve(names.size());
    for (const auto& n : names) used.push_back(&column(n));

    std::vector<int> keep;
    keep.reserve(rows_);
    for (int i = 0; i < rows_; ++i) {
        bool finite = true;
        for (const Eigen::VectorXd* col : used) {
            if (!std::isfinite((*col)(i))) {
                finite = false;
                break;
            }
        }
        if (finite) keep.push_back(i);
    }
    if (static_cast<int>(keep.size()) == rows_) return *this;
    return take_rows(keep);
}

std::string Dataset::unique_column_name(const std::string& base) const {
    std::string name = base;
    while (has_column(name)) {
        name = "_" + name;
    }
    return name;
}

} // namespace dagstat
