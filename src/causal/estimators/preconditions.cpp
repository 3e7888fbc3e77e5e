#include "preconditions.h"

#include <cmath>
#include <sstream>

#include <spdlog/spdlog.h>

namespace dagstat {
namespace preconditions {

namespace {

template <typename Container>
std::string join(const Container& names) {
    std::ostringstream os;
    os << "[";
    bool first = true;
    for (const auto& n : names) {
        if (!first) os << ", ";
        os << "'" << n << "'";
        first = false;
    }
    os << "]";
    return os.str();
}

} // namespace

void require_node(const graph::CausalGraph& g, const Role& role) {
    if (!g.has_node(role.second)) {
        throw ValidationError(
            role.first + " '" + role.second + "' is not a node in the causal graph. "
            "Known nodes: " + join(g.nodes()));
    }
}

void require_distinct(const std::vector<Role>& roles) {
    for (size_t i = 0; i < roles.size(); ++i) {
        for (size_t j = i + 1; j < roles.size(); ++j) {
            if (roles[i].second == roles[j].second) {
                throw ValidationError(
                    roles[i].first + " and " + roles[j].first +
                    " must be different variables, got '" + roles[i].second + "' for both");
            }
        }
    }
}

void require_column(const Dataset& data, const Role& role) {
    if (!data.has_column(role.second)) {
        throw ValidationError(role.first + " column '" + role.second + "' not found in dataset");
    }
}

void require_binary(const Dataset& data, const Role& role) {
    const Eigen::VectorXd& v = data.column(role.second);
    std::set<double> seen;
    for (int i = 0; i < v.size(); ++i) {
        // NaN would compare equal to every element of the set
        if (!std::isfinite(v(i))) {
            throw ValidationError(
                role.first + " '" + role.second + "' must be binary (0/1). Found a "
                "non-finite value at row " + std::to_string(i));
        }
        seen.insert(v(i));
    }
    for (double x : seen) {
        if (x != 0.0 && x != 1.0) {
            std::ostringstream os;
            os << role.first << " '" << role.second << "' must be binary (0/1). Found values: [";
            bool first = true;
            for (double s : seen) {
                if (!first) os << ", ";
                os << s;
                first = false;
            }
            os << "]";
            throw ValidationError(os.str());
        }
    }
    if (seen.size() < 2) {
        throw ValidationError(
            role.first + " '" + role.second + "' must contain both 0 and 1");
    }
}

Dataset complete_cases(const Dataset& data, const std::vector<std::string>& columns) {
    Dataset complete = data.complete_rows(columns);
    const int dropped = data.rows() - complete.rows();
    if (dropped > 0) {
        spdlog::info("[data] dropped {} of {} rows with missing values in {}",
                     dropped, data.rows(), join(columns));
    }
    if (complete.rows() == 0) {
        throw ValidationError("No complete rows remain in " + join(columns) +
                              " after dropping missing values");
    }
    return complete;
}

IdentificationError missing_confounders(
    const std::string& treatment,
    const std::string& outcome,
    const std::set<std::string>& missing
) {
    std::vector<std::string> sorted(missing.begin(), missing.end());
    std::string names = join(sorted);
    std::string msg =
        "Causal graph confounders not found in dataset: " + names + "\n\n"
        "The graph declares these variables as confounders of '" + treatment +
        "' and '" + outcome + "', but they are absent from the dataset and cannot be "
        "controlled for.\n\n"
        "Consider:\n"
        "  - Collecting data on " + names + " and adding it to the dataset\n"
        "  - IV estimation if you have a valid instrument for '" + treatment + "'\n"
        "  - DiD or RD if a natural experiment is available";
    return IdentificationError(msg, std::move(sorted));
}

} // namespace preconditions
} // namespace dagstat
