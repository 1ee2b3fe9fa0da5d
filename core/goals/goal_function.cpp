#include "goals/goal_function.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace advtext {

namespace {

void normalize(std::vector<double>& row) {
    double sum = 0.0;
    for (double v : row) sum += v;
    if (std::abs(sum - 1.0) < 1e-6) return;

    double max_v = *std::max_element(row.begin(), row.end());
    double total = 0.0;
    for (double& v : row) {
        v = std::exp(v - max_v);
        total += v;
    }
    for (double& v : row) v /= total;
}

} // namespace

GoalFunction::GoalFunction(ModelFn model, GoalFunctionConfig config)
    : model_(std::move(model)), config_(config), model_cache_(config.model_cache_size) {
    if (!model_) {
        throw ConfigurationError("Cannot instantiate goal function without a model");
    }
    if (config_.query_budget < 1) {
        throw ConfigurationError(fmt::format(
            "Query budget must be positive, got {}", config_.query_budget));
    }
    if (config_.batch_size == 0) {
        throw ConfigurationError("Model batch size must be positive");
    }
}

std::pair<GoalFunctionResult, bool> GoalFunction::getResult(const AttackedText& text,
                                                            int ground_truth_output) {
    ground_truth_ = ground_truth_output;
    auto [results, search_over] = getResults({text});
    if (results.empty()) {
        throw std::runtime_error(fmt::format(
            "Query budget of {} exhausted before scoring the initial text", config_.query_budget));
    }
    return {std::move(results.front()), search_over};
}

std::pair<std::vector<GoalFunctionResult>, bool> GoalFunction::getResults(
    const std::vector<AttackedText>& texts
) {
    if (!ground_truth_) {
        throw std::runtime_error("getResults called before getResult set a ground truth");
    }

    size_t queries_left = static_cast<size_t>(std::max(0, config_.query_budget - num_queries_));
    std::vector<AttackedText> batch(texts.begin(),
                                    texts.begin() + std::min(texts.size(), queries_left));
    num_queries_ += static_cast<int>(batch.size());

    std::vector<GoalFunctionResult> results;
    if (!batch.empty()) {
        auto outputs = callModel(batch);
        results.reserve(batch.size());
        for (size_t i = 0; i < batch.size(); i++) {
            GoalFunctionResult r;
            r.text = batch[i];
            r.raw_output = outputs[i];
            r.output = predictedClass(outputs[i]);
            r.succeeded = isGoalComplete(outputs[i], *ground_truth_);
            r.score = getScore(outputs[i], *ground_truth_);
            r.num_queries = num_queries_;
            results.push_back(std::move(r));
        }
    }

    bool search_over = num_queries_ >= config_.query_budget;
    if (search_over && batch.size() < texts.size()) {
        log::warn("{}: query budget of {} exhausted, dropped {} of {} texts",
                  name(), config_.query_budget, texts.size() - batch.size(), texts.size());
    }
    return {std::move(results), search_over};
}

std::vector<std::vector<double>> GoalFunction::callModel(const std::vector<AttackedText>& texts) {
    std::vector<std::vector<double>> outputs(texts.size());
    std::vector<size_t> uncached;
    for (size_t i = 0; i < texts.size(); i++) {
        if (const auto* cached = model_cache_.get(texts[i].text())) {
            outputs[i] = *cached;
        } else {
            uncached.push_back(i);
        }
    }

    for (size_t start = 0; start < uncached.size(); start += config_.batch_size) {
        size_t end = std::min(uncached.size(), start + config_.batch_size);
        std::vector<std::string> inputs;
        for (size_t k = start; k < end; k++) inputs.push_back(texts[uncached[k]].text());

        auto rows = model_(inputs);
        if (rows.size() != inputs.size()) {
            throw std::runtime_error(fmt::format(
                "Model returned {} outputs for {} inputs", rows.size(), inputs.size()));
        }
        for (size_t k = start; k < end; k++) {
            auto& row = rows[k - start];
            if (row.empty()) {
                throw std::runtime_error("Model returned an empty output row");
            }
            normalize(row);
            model_cache_.put(texts[uncached[k]].text(), row);
            outputs[uncached[k]] = std::move(row);
        }
    }
    return outputs;
}

int GoalFunction::predictedClass(const std::vector<double>& output) {
    return static_cast<int>(std::max_element(output.begin(), output.end()) - output.begin());
}

std::string GoalFunction::str() const {
    std::string extra = extraRepr();
    return fmt::format("{}({}{}query_budget={})", name(), extra, extra.empty() ? "" : ", ",
                       config_.query_budget);
}

} // namespace advtext
