// PyBind11 bindings for the advtext C++ core.
// Exposes texts, datasets, configs, the synonym-swap recipe and attack
// results to Python. The victim model is a Python callable mapping a list
// of strings to a list of score rows.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "attack/attack.hpp"
#include "attack/attack_result.hpp"
#include "attack/recipes.hpp"
#include "constraints/word_embedding_distance.hpp"
#include "dataset/dataset.hpp"
#include "text/attacked_text.hpp"
#include "util/log.hpp"

namespace py = pybind11;

PYBIND11_MODULE(advtext_bindings, m) {
    m.doc() = "advtext C++ Core Bindings";

    // ── AttackedText ──
    py::class_<advtext::AttackedText>(m, "AttackedText")
        .def(py::init<std::string>(), py::arg("text"))
        .def_property_readonly("text", &advtext::AttackedText::text)
        .def_property_readonly("words", &advtext::AttackedText::words)
        .def("num_words", &advtext::AttackedText::numWords)
        .def("replace_word_at_index", &advtext::AttackedText::replaceWordAtIndex)
        .def("delete_word_at_index", &advtext::AttackedText::deleteWordAtIndex)
        .def("words_diff", &advtext::AttackedText::wordsDiff)
        .def("modified_indices", [](const advtext::AttackedText& t) {
            const auto& s = t.attackAttrs().modified_indices;
            return std::vector<size_t>(s.begin(), s.end());
        })
        .def("__eq__", &advtext::AttackedText::operator==)
        .def("__hash__", [](const advtext::AttackedText& t) { return advtext::AttackedTextHash{}(t); })
        .def("__repr__", [](const advtext::AttackedText& t) {
            return "<AttackedText \"" + t.text() + "\">";
        });

    // ── GoalFunctionResult ──
    py::class_<advtext::GoalFunctionResult>(m, "GoalFunctionResult")
        .def_readonly("text", &advtext::GoalFunctionResult::text)
        .def_readonly("output", &advtext::GoalFunctionResult::output)
        .def_readonly("succeeded", &advtext::GoalFunctionResult::succeeded)
        .def_readonly("score", &advtext::GoalFunctionResult::score)
        .def_readonly("num_queries", &advtext::GoalFunctionResult::num_queries)
        .def_readonly("raw_output", &advtext::GoalFunctionResult::raw_output);

    // ── AttackResult ──
    py::class_<advtext::AttackResult> result(m, "AttackResult");
    py::enum_<advtext::AttackResult::Kind>(result, "Kind")
        .value("SUCCESSFUL", advtext::AttackResult::Kind::Successful)
        .value("FAILED", advtext::AttackResult::Kind::Failed)
        .value("SKIPPED", advtext::AttackResult::Kind::Skipped);
    result
        .def_property_readonly("kind", &advtext::AttackResult::kind)
        .def_property_readonly("original_result", &advtext::AttackResult::originalResult)
        .def_property_readonly("perturbed_result", &advtext::AttackResult::perturbedResult)
        .def_property_readonly("num_queries", &advtext::AttackResult::numQueries)
        .def("__str__", &advtext::AttackResult::str);
    py::class_<advtext::SuccessfulAttackResult, advtext::AttackResult>(m, "SuccessfulAttackResult");
    py::class_<advtext::FailedAttackResult, advtext::AttackResult>(m, "FailedAttackResult");
    py::class_<advtext::SkippedAttackResult, advtext::AttackResult>(m, "SkippedAttackResult");

    // ── Dataset ──
    py::class_<advtext::Dataset>(m, "Dataset")
        .def("size", &advtext::Dataset::size)
        .def("label_names", &advtext::Dataset::labelNames);

    py::class_<advtext::InMemoryDataset, advtext::Dataset>(m, "InMemoryDataset")
        .def(py::init<>())
        .def(py::init([](const std::vector<std::pair<std::string, int>>& rows,
                         std::optional<std::vector<std::string>> label_names) {
            std::vector<advtext::Example> examples;
            for (const auto& [text, label] : rows) examples.push_back({text, label});
            return advtext::InMemoryDataset(std::move(examples), std::move(label_names));
        }), py::arg("examples"), py::arg("label_names") = py::none())
        .def("add", &advtext::InMemoryDataset::add);

    // ── WordEmbedding ──
    py::class_<advtext::WordEmbedding, std::shared_ptr<advtext::WordEmbedding>>(m, "WordEmbedding")
        .def(py::init<std::vector<std::string>, std::vector<std::vector<double>>>(),
             py::arg("vocabulary"), py::arg("vectors"))
        .def("word_id", &advtext::WordEmbedding::wordId)
        .def("cos_sim", &advtext::WordEmbedding::cosSim)
        .def("mse_dist", &advtext::WordEmbedding::mseDist)
        .def("size", &advtext::WordEmbedding::size);

    // ── Configs ──
    py::class_<advtext::AttackConfig>(m, "AttackConfig")
        .def(py::init<>())
        .def_readwrite("constraint_cache_size", &advtext::AttackConfig::constraint_cache_size);

    py::class_<advtext::GoalFunctionConfig>(m, "GoalFunctionConfig")
        .def(py::init<>())
        .def_readwrite("query_budget", &advtext::GoalFunctionConfig::query_budget)
        .def_readwrite("model_cache_size", &advtext::GoalFunctionConfig::model_cache_size)
        .def_readwrite("batch_size", &advtext::GoalFunctionConfig::batch_size);

    py::class_<advtext::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("beam_width", &advtext::SearchConfig::beam_width);

    py::class_<advtext::SynonymSwapRecipeConfig>(m, "SynonymSwapRecipeConfig")
        .def(py::init<>())
        .def_readwrite("attack", &advtext::SynonymSwapRecipeConfig::attack)
        .def_readwrite("goal", &advtext::SynonymSwapRecipeConfig::goal)
        .def_readwrite("search", &advtext::SynonymSwapRecipeConfig::search)
        .def_readwrite("min_cos_sim", &advtext::SynonymSwapRecipeConfig::min_cos_sim)
        .def_readwrite("max_num_words", &advtext::SynonymSwapRecipeConfig::max_num_words);

    // ── Attack ──
    py::class_<advtext::Attack, std::unique_ptr<advtext::Attack>>(m, "Attack")
        .def("is_black_box", &advtext::Attack::isBlackBox)
        .def("get_transformations", [](advtext::Attack& self, const advtext::AttackedText& text) {
            return self.getTransformations(text, &text);
        }, py::arg("text"))
        .def("attack_dataset", [](advtext::Attack& self, const advtext::Dataset& dataset,
                                  std::optional<std::vector<size_t>> indices) {
            std::vector<std::unique_ptr<advtext::AttackResult>> results;
            auto it = self.attackDataset(dataset, std::move(indices));
            while (auto r = it.next()) results.push_back(std::move(r));
            return results;
        }, py::arg("dataset"), py::arg("indices") = py::none())
        .def("__str__", &advtext::Attack::str);

    m.def("make_synonym_swap_attack",
        [](advtext::ModelFn model,
           std::unordered_map<std::string, std::vector<std::string>> synonyms,
           std::shared_ptr<advtext::WordEmbedding> embedding,
           const advtext::SynonymSwapRecipeConfig& config) {
            return advtext::makeSynonymSwapAttack(std::move(model), std::move(synonyms),
                                                  std::move(embedding), config);
        },
        py::arg("model"), py::arg("synonyms"), py::arg("embedding") = nullptr,
        py::arg("config") = advtext::SynonymSwapRecipeConfig{});

    m.def("set_log_level", [](const std::string& level) {
        advtext::log::setLevel(advtext::log::parseLevel(level));
    }, py::arg("level"));
}
