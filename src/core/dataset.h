/**
 * @file dataset.h
 * @brief DagStat v1.0 - Named Column Dataset
 *
 * Column-oriented table of doubles. Column names are matched against the
 * node names of a causal graph: a graph node without a column is treated
 * as unobserved.
 */
#ifndef DAGSTAT_DATASET_H
#define DAGSTAT_DATASET_H

#include <Eigen/Dense>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace dagstat {

class Dataset {
public:
    Dataset() = default;

    /**
     * @brief Append a column
     *
     * @throws std::invalid_argument if the name is taken or the length
     *         differs from existing columns
     */
    Dataset& add_column(const std::string& name, const Eigen::VectorXd& values);

    // Copy of this dataset with `name` replaced (or appended if absent)
    Dataset with_column(const std::string& name, const Eigen::VectorXd& values) const;

    bool has_column(const std::string& name) const { return index_.count(name) > 0; }

    // @throws std::out_of_range for unknown names
    const Eigen::VectorXd& column(const std::string& name) const;

    const std::vector<std::string>& column_names() const { return names_; }
    std::set<std::string> column_set() const;

    int rows() const { return rows_; }
    int cols() const { return static_cast<int>(names_.size()); }

    // Columns stacked in the given order (n x k)
    Eigen::MatrixXd matrix(const std::vector<std::string>& names) const;

    // Row subset, duplicates allowed (bootstrap resampling)
    Dataset take_rows(const std::vector<int>& indices) const;

    // Rows where every listed column is finite; all columns are kept
    Dataset complete_rows(const std::vector<std::string>& names) const;

    /**
     * @brief A column name not yet in use
     *
     * Returns `base` if free, otherwise prefixes underscores until unique.
     */
    std::string unique_column_name(const std::string& base) const;

private:
    std::vector<std::string> names_;
    std::vector<Eigen::VectorXd> columns_;
    std::unordered_map<std::string, size_t> index_;
    int rows_ = 0;
};

} // namespace dagstat

#endif // DAGSTAT_DATASET_H
