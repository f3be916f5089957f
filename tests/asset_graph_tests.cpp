#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kiln/asset_graph.hpp"
#include "kiln/build_cache.hpp"
#include "kiln/constants.hpp"

#include "test_support.hpp"

namespace {

using kiln::AssetGraph;
using kiln::AssetId;
using kiln::AssetIdSet;
using kiln::BuildAction;
using kiln::ChangeType;
using kiln::GeneratedNode;
using kiln::SourceNode;
using kiln::testing::make_action;
using kiln::testing::TempWorkspace;

struct TestCase {
    const char *name;
    const char *intent;
    std::function<bool(void)> run;
};

const AssetId kSourceA{"app", "lib/a.dart"};
const AssetId kOutputA{"app", "lib/a.g.dart"};
const AssetId kChainedA{"app", "lib/a.g.json"};

std::vector<BuildAction> two_phase_actions() {
    return {
        make_action("app", "app|gen", ".dart", {".g.dart"}),
        make_action("app", "app|summary", ".g.dart", {".g.json"}),
    };
}

const GeneratedNode *generated(const AssetGraph &graph, const AssetId &id) {
    return std::get_if<GeneratedNode>(graph.get(id));
}

GeneratedNode *generated(AssetGraph &graph, const AssetId &id) {
    return std::get_if<GeneratedNode>(graph.get(id));
}

kiln::Result<AssetGraph> build_graph(const TempWorkspace &workspace,
                                     const std::vector<BuildAction> &actions,
                                     const AssetIdSet &inputs,
                                     const AssetIdSet &internal = {}) {
    kiln::FileBasedAssetReader reader(workspace.packages());
    return AssetGraph::build(actions, inputs, internal, workspace.packages(), reader);
}

kiln::DeleteCallback recording_delete(std::vector<AssetId> &deleted) {
    return [&deleted](const AssetId &id) -> kiln::Result<void> {
        deleted.push_back(id);
        return {};
    };
}

// Intent: build should chain phases and record who produced what.
bool test_build_creates_chained_outputs() {
    TempWorkspace workspace;
    auto graph = build_graph(workspace, two_phase_actions(), {kSourceA, {"app", "lib/b.txt"}});
    if (!graph) {
        return false;
    }
    const auto *source = std::get_if<SourceNode>(graph->get(kSourceA));
    const GeneratedNode *output = generated(*graph, kOutputA);
    const GeneratedNode *chained = generated(*graph, kChainedA);
    if (!source || !output || !chained) {
        return false;
    }
    return source->primary_outputs == std::set<AssetId>{kOutputA} && !source->last_known_digest &&
           output->phase == 0 && output->primary_input == kSourceA && output->needs_update && !output->was_output &&
           output->primary_outputs == std::set<AssetId>{kChainedA} && chained->phase == 1 &&
           chained->primary_input == kOutputA && graph->outputs().size() == 2 && graph->sources().size() == 2 &&
           graph->contains(kiln::builder_options_id_for_phase("app", 0)) &&
           graph->contains(kiln::builder_options_id_for_phase("app", 1));
}

// Intent: a phase must not consume outputs of itself or of later phases.
bool test_build_ignores_outputs_of_later_phases() {
    TempWorkspace workspace;
    std::vector<BuildAction> actions = {
        make_action("app", "app|summary", ".g.dart", {".g.json"}),
        make_action("app", "app|gen", ".dart", {".g.dart"}),
    };
    auto graph = build_graph(workspace, actions, {kSourceA});
    return graph && generated(*graph, kOutputA) && !graph->contains(kChainedA);
}

// Intent: internal sources are digested straight away.
bool test_build_digests_internal_sources() {
    TempWorkspace workspace;
    workspace.write(".kiln/entrypoint/build.json", "{}");
    const AssetId script{"app", ".kiln/entrypoint/build.json"};
    auto graph = build_graph(workspace, {}, {}, {script});
    if (!graph) {
        return false;
    }
    const auto *internal = std::get_if<kiln::InternalNode>(graph->get(script));
    return internal && internal->last_known_digest == kiln::compute_digest("{}").value();
}

// Intent: a source found where an output is declared becomes that output.
bool test_build_replaces_colliding_source() {
    TempWorkspace workspace;
    auto graph = build_graph(workspace, two_phase_actions(), {kSourceA, kOutputA});
    if (!graph) {
        return false;
    }
    const GeneratedNode *output = generated(*graph, kOutputA);
    return output && output->primary_input == kSourceA && !graph->sources().contains(kOutputA) &&
           generated(*graph, kChainedA);
}

// Intent: two phases may not declare the same output.
bool test_build_rejects_duplicate_outputs() {
    TempWorkspace workspace;
    std::vector<BuildAction> actions = {
        make_action("app", "app|first", ".dart", {".g.dart"}),
        make_action("app", "app|second", ".dart", {".g.dart"}),
    };
    auto graph = build_graph(workspace, actions, {kSourceA});
    return !graph && graph.error().kind == kiln::ErrorKind::DuplicateOutput && graph.error().assets.size() == 1 &&
           graph.error().assets[0] == kOutputA;
}

// Intent: round trip keeps the fingerprint and every node digest.
bool test_serialize_round_trip() {
    TempWorkspace workspace;
    workspace.write("lib/a.dart", "void main() {}");
    workspace.write(".kiln/entrypoint/build.json", "{}");
    auto graph =
        build_graph(workspace, two_phase_actions(), {kSourceA}, {{"app", ".kiln/entrypoint/build.json"}});
    if (!graph) {
        return false;
    }
    kiln::FileBasedAssetReader reader(workspace.packages());
    if (!graph->refresh_digests(reader)) {
        return false;
    }
    GeneratedNode *output = generated(*graph, kOutputA);
    output->was_output = true;
    output->needs_update = false;
    output->last_known_digest = "0123";

    auto restored = AssetGraph::deserialize(graph->serialize());
    if (!restored || restored->build_actions_digest() != graph->build_actions_digest() ||
        restored->all_nodes().size() != graph->all_nodes().size()) {
        return false;
    }
    for (const auto &[id, node] : graph->all_nodes()) {
        const kiln::AssetNode *other = restored->get(id);
        if (!other || other->index() != node.index() ||
            kiln::last_known_digest(*other) != kiln::last_known_digest(node)) {
            return false;
        }
    }
    const GeneratedNode *copy = generated(*restored, kOutputA);
    return copy && copy->was_output && !copy->needs_update && copy->phase == 0 && copy->primary_input == kSourceA &&
           copy->primary_outputs == output->primary_outputs;
}

// Intent: other format versions are reported distinctly from garbage.
bool test_deserialize_reports_version_mismatch() {
    TempWorkspace workspace;
    auto graph = build_graph(workspace, two_phase_actions(), {kSourceA});
    if (!graph) {
        return false;
    }
    nlohmann::json doc = nlohmann::json::parse(graph->serialize());
    doc["version"] = kiln::asset_graph_version + 1;
    auto old = AssetGraph::deserialize(doc.dump());
    auto garbage = AssetGraph::deserialize("not json");
    auto bad_node = AssetGraph::deserialize(
        R"({"version": )" + std::to_string(kiln::asset_graph_version) +
        R"(, "buildActionsDigest": "x", "nodes": [{"type": "mystery", "id": "app|a", "digest": null}]})");
    return !old && old.error().kind == kiln::ErrorKind::VersionMismatch && !garbage &&
           garbage.error().kind == kiln::ErrorKind::Generic && !bad_node &&
           bad_node.error().kind == kiln::ErrorKind::Generic;
}

// Intent: an added source picks up outputs from every matching phase.
bool test_update_adds_source_with_outputs() {
    TempWorkspace workspace;
    auto actions = two_phase_actions();
    auto graph = build_graph(workspace, actions, {});
    if (!graph) {
        return false;
    }
    std::vector<AssetId> deleted;
    kiln::FileBasedAssetReader reader(workspace.packages());
    auto res = graph->update_and_invalidate(actions, {{kSourceA, ChangeType::Added}}, recording_delete(deleted), reader);
    return res && std::holds_alternative<SourceNode>(*graph->get(kSourceA)) && generated(*graph, kOutputA) &&
           generated(*graph, kChainedA) && deleted.empty();
}

// Intent: removing a source drops its outputs and deletes only those that were written.
bool test_update_removes_source_and_outputs() {
    TempWorkspace workspace;
    auto actions = two_phase_actions();
    auto graph = build_graph(workspace, actions, {kSourceA});
    if (!graph) {
        return false;
    }
    generated(*graph, kOutputA)->was_output = true;

    std::vector<AssetId> deleted;
    kiln::FileBasedAssetReader reader(workspace.packages());
    auto res =
        graph->update_and_invalidate(actions, {{kSourceA, ChangeType::Removed}}, recording_delete(deleted), reader);
    return res && !graph->contains(kSourceA) && !graph->contains(kOutputA) && !graph->contains(kChainedA) &&
           deleted == std::vector<AssetId>{kOutputA};
}

// Intent: a vanished output is regenerated, not forgotten.
bool test_update_removed_output_needs_regeneration() {
    TempWorkspace workspace;
    auto actions = two_phase_actions();
    auto graph = build_graph(workspace, actions, {kSourceA});
    if (!graph) {
        return false;
    }
    for (const AssetId &id : {kOutputA, kChainedA}) {
        GeneratedNode *node = generated(*graph, id);
        node->was_output = true;
        node->needs_update = false;
        node->last_known_digest = "abc";
    }

    std::vector<AssetId> deleted;
    kiln::FileBasedAssetReader reader(workspace.packages());
    auto res =
        graph->update_and_invalidate(actions, {{kOutputA, ChangeType::Removed}}, recording_delete(deleted), reader);
    const GeneratedNode *output = generated(*graph, kOutputA);
    const GeneratedNode *chained = generated(*graph, kChainedA);
    return res && output && !output->was_output && output->needs_update && !output->last_known_digest && chained &&
           chained->needs_update && chained->was_output && deleted.empty();
}

// Intent: editing a source forgets its digest and dirties everything downstream.
bool test_update_modified_source_invalidates_descendants() {
    TempWorkspace workspace;
    auto actions = two_phase_actions();
    auto graph = build_graph(workspace, actions, {kSourceA});
    if (!graph) {
        return false;
    }
    kiln::last_known_digest(*graph->get(kSourceA)) = "old";
    generated(*graph, kOutputA)->needs_update = false;
    generated(*graph, kChainedA)->needs_update = false;

    std::vector<AssetId> deleted;
    kiln::FileBasedAssetReader reader(workspace.packages());
    auto res =
        graph->update_and_invalidate(actions, {{kSourceA, ChangeType::Modified}}, recording_delete(deleted), reader);
    return res && !kiln::last_known_digest(*graph->get(kSourceA)) && generated(*graph, kOutputA)->needs_update &&
           generated(*graph, kChainedA)->needs_update;
}

// Intent: changed options dirty exactly the outputs of their phase.
bool test_update_modified_options_dirty_phase() {
    TempWorkspace workspace;
    auto actions = two_phase_actions();
    auto graph = build_graph(workspace, actions, {kSourceA});
    if (!graph) {
        return false;
    }
    generated(*graph, kOutputA)->needs_update = false;
    generated(*graph, kChainedA)->needs_update = false;

    std::vector<AssetId> deleted;
    kiln::FileBasedAssetReader reader(workspace.packages());
    auto res = graph->update_and_invalidate(actions,
                                            {{kiln::builder_options_id_for_phase("app", 1), ChangeType::Modified}},
                                            recording_delete(deleted),
                                            reader);
    return res && !generated(*graph, kOutputA)->needs_update && generated(*graph, kChainedA)->needs_update;
}

// Intent: refresh fills missing digests for files that exist and leaves the rest alone.
bool test_refresh_digests() {
    TempWorkspace workspace;
    workspace.write("lib/a.dart", "a");
    auto graph = build_graph(workspace, two_phase_actions(), {kSourceA, {"app", "lib/gone.txt"}});
    if (!graph) {
        return false;
    }
    kiln::FileBasedAssetReader reader(workspace.packages());
    auto res = graph->refresh_digests(reader);
    return res && kiln::last_known_digest(*graph->get(kSourceA)) == kiln::compute_digest("a").value() &&
           !kiln::last_known_digest(*graph->get({"app", "lib/gone.txt"})) &&
           !kiln::last_known_digest(*graph->get(kOutputA));
}

// Intent: hidden outputs are read and written under the generated output directory.
bool test_build_cache_redirects_hidden_outputs() {
    TempWorkspace workspace;
    std::vector<BuildAction> actions = {make_action("dep", "dep|gen", ".txt", {".out"}, true)};
    const AssetId input{"dep", "lib/x.txt"};
    const AssetId hidden{"dep", "lib/x.out"};
    auto built = build_graph(workspace, actions, {input});
    if (!built) {
        return false;
    }
    auto graph = std::make_shared<const AssetGraph>(std::move(*built));
    auto packages = workspace.packages();
    kiln::BuildCacheWriter writer(std::make_shared<kiln::FileBasedAssetWriter>(packages), graph, "app");
    kiln::BuildCacheReader reader(std::make_shared<kiln::FileBasedAssetReader>(packages), graph, "app");

    if (kiln::cache_location(input, *graph, "app") != input) {
        return false;
    }
    if (!writer.write_as_string(hidden, "generated")) {
        return false;
    }
    auto text = reader.read_as_string(hidden);
    const bool redirected = workspace.exists(".kiln/generated/dep/lib/x.out") && !workspace.exists("packages/dep/lib/x.out");
    return text && *text == "generated" && redirected && writer.remove(hidden) &&
           !workspace.exists(".kiln/generated/dep/lib/x.out");
}

} // namespace

int main() {
    const std::vector<TestCase> tests = {
        {"Build_ChainedOutputs", "phases chain through generated outputs", test_build_creates_chained_outputs},
        {"Build_PhaseOrder", "phases never read outputs of later phases", test_build_ignores_outputs_of_later_phases},
        {"Build_InternalDigests", "internal sources are digested on build", test_build_digests_internal_sources},
        {"Build_CollidingSource", "declared output replaces a colliding source", test_build_replaces_colliding_source},
        {"Build_DuplicateOutput", "duplicate declarations are rejected", test_build_rejects_duplicate_outputs},
        {"Serialize_RoundTrip", "fingerprint and digests survive a round trip", test_serialize_round_trip},
        {"Deserialize_Version", "version mismatch is distinct from parse errors", test_deserialize_reports_version_mismatch},
        {"Update_AddedSource", "added source gets outputs", test_update_adds_source_with_outputs},
        {"Update_RemovedSource", "removed source drops and deletes outputs", test_update_removes_source_and_outputs},
        {"Update_RemovedOutput", "removed output is marked for regeneration", test_update_removed_output_needs_regeneration},
        {"Update_ModifiedSource", "modified source dirties descendants", test_update_modified_source_invalidates_descendants},
        {"Update_ModifiedOptions", "modified options dirty one phase", test_update_modified_options_dirty_phase},
        {"RefreshDigests", "missing digests are filled from disk", test_refresh_digests},
        {"BuildCache_Hidden", "hidden outputs are shadowed into the cache", test_build_cache_redirects_hidden_outputs},
    };

    bool all_passed = true;
    for (const TestCase &test : tests) {
        const bool passed = test.run();
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
        all_passed = all_passed && passed;
    }

    if (!all_passed) {
        std::cerr << "asset graph tests failed\n";
        return 1;
    }

    std::cout << "asset graph tests passed (" << tests.size() << " cases)\n";
    return 0;
}
