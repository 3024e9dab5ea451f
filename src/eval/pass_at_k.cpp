#include "eval/pass_at_k.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <numeric>
#include <set>
#include <stdexcept>
#include "common/stl_utils.hpp"

namespace codeeval {
using namespace std;

double estimate_pass_at_k(size_t n, size_t c, size_t k) {
    if (k == 0) throw invalid_argument("k should be positive");
    if (c > n) throw invalid_argument(fmt::format("number of correct samples {} exceeds number of samples {}", c, n));

    if (n - c < k) return 1.0;

    double prob_all_wrong = 1.0;
    for (size_t i = n - c + 1; i <= n; ++i)
        prob_all_wrong *= 1.0 - (double)k / (double)i;
    return 1.0 - prob_all_wrong;
}

vector<double> estimate_pass_at_k(const vector<size_t> &totals, const vector<size_t> &corrects, size_t k) {
    if (totals.size() != corrects.size())
        throw invalid_argument(fmt::format("totals has {} elements but corrects has {}", totals.size(), corrects.size()));

    vector<double> result;
    result.reserve(totals.size());
    for (size_t i = 0; i < totals.size(); ++i)
        result.push_back(estimate_pass_at_k(totals[i], corrects[i], k));
    return result;
}

vector<double> estimate_pass_at_k(size_t total, const vector<size_t> &corrects, size_t k) {
    return estimate_pass_at_k(vector<size_t>(corrects.size(), total), corrects, k);
}

vector<metric> compute_pass_at_k(const map<string, task_counts> &counts, const vector<size_t> &ks) {
    vector<metric> metrics;
    if (counts.empty()) return metrics;

    vector<size_t> totals, corrects;
    for (auto &[task_id, count] : counts) {
        totals.push_back(count.total);
        corrects.push_back(count.correct);
    }
    size_t min_total = *min_element(totals.begin(), totals.end());

    set<size_t> seen;
    for (size_t k : ks) {
        if (!seen.insert(k).second) continue;
        if (k == 0 || min_total < k) continue;

        vector<double> estimates = estimate_pass_at_k(totals, corrects, k);
        double mean = accumulate(estimates.begin(), estimates.end(), 0.0) / estimates.size();
        metrics.push_back({fmt::format("pass@{}", k), k, mean});
    }
    return metrics;
}

vector<size_t> parse_k_list(const string &literal) {
    vector<string> tokens;
    boost::split(tokens, literal, boost::is_any_of(","));

    vector<size_t> ks;
    for (auto &token : tokens) {
        string k = boost::trim_copy(token);
        if (!is_integer(k))
            throw invalid_argument(fmt::format("invalid k '{}' in '{}'", k, literal));
        size_t value;
        try {
            value = boost::lexical_cast<size_t>(k);
        } catch (boost::bad_lexical_cast &) {
            throw invalid_argument(fmt::format("k '{}' is out of range", k));
        }
        if (value == 0)
            throw invalid_argument(fmt::format("k should be positive in '{}'", literal));
        ks.push_back(value);
    }
    return ks;
}

}  // namespace codeeval
