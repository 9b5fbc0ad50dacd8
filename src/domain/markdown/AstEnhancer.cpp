#include "domain/markdown/AstEnhancer.hpp"
#include "domain/markdown/ZeroWidthScanner.hpp"
#include "domain/transpile/Target.hpp"
#include <sstream>

namespace polyglot::domain::markdown {

namespace {
    bool IsTrue(const std::string& value) {
        return value == "true" || value == "1" || value == "yes";
    }

    std::vector<std::string> SplitList(const std::string& value) {
        std::vector<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) items.push_back(item);
        }
        return items;
    }

    // Everything the preceding directives say about the next code block.
    KyozoData FromDirectives(const std::vector<const Directive*>& directives) {
        KyozoData data;
        for (const Directive* d : directives) {
            if (d->jsonPayload) {
                for (const auto& [k, v] : d->params) {
                    data.metadata[k] = v;
                    if (k == "executable") data.executable = IsTrue(v);
                    else if (k == "enlighten") data.enlightened = IsTrue(v);
                    else if (k == "hidden") data.hidden = IsTrue(v);
                    else if (k == "executor") data.executor = v;
                    else if (k == "dependencies") data.dependencies = SplitList(v);
                }
                continue;
            }
            data.metadata[d->name] = d->value.value_or("true");
            for (const auto& [k, v] : d->params) data.metadata[d->name + "." + k] = v;
            if (d->name == "executable") data.executable = true;
            else if (d->name == "enlighten") data.enlightened = true;
            else if (d->name == "hidden") data.hidden = true;
            else if (d->name == "executor" && d->value) data.executor = *d->value;
        }
        return data;
    }

    // Existing node data wins over derived data.
    void MergeInto(AstNode& node, const KyozoData& derived) {
        if (!node.data.kyozo) {
            node.data.kyozo = derived;
            return;
        }
        KyozoData& existing = *node.data.kyozo;
        existing.executable = existing.executable || derived.executable;
        existing.enlightened = existing.enlightened || derived.enlightened;
        existing.hidden = existing.hidden || derived.hidden;
        if (existing.executor.empty()) existing.executor = derived.executor;
        for (const auto& [k, v] : derived.metadata) existing.metadata.emplace(k, v);
        if (existing.dependencies.empty()) existing.dependencies = derived.dependencies;
    }

    const Artifact* ArtifactAtLine(const ArtifactList& artifacts, int line) {
        for (const auto& artifact : artifacts) {
            if (artifact.sourceLine == line) return &artifact;
        }
        return nullptr;
    }

    void EnhanceCode(AstNode& code, const std::vector<const Directive*>& pending, const Extraction& extraction) {
        KyozoData derived = FromDirectives(pending);
        bool touched = !pending.empty();

        if (code.position) {
            if (const Artifact* artifact = ArtifactAtLine(extraction.artifacts, code.position->start.line)) {
                if (derived.executor.empty()) derived.executor = transpile::TargetToString(transpile::TargetForArtifact(artifact->type));
                derived.executable = derived.executable || artifact->executable;
                if (artifact->location) code.data.attributes.emplace("path", *artifact->location);
                touched = true;
            }
        }
        if (ZeroWidthScanner::Contains(code.value)) {
            derived.hidden = true;
            touched = true;
        }
        if (touched) MergeInto(code, derived);
    }

    void EnhanceChildren(AstNode& parent, const Extraction& extraction) {
        std::vector<const Directive*> pending;
        for (auto& child : parent.children) {
            if (child.type == NodeType::Html && child.position) {
                for (const auto& d : extraction.directives) {
                    if (d.startLine >= child.position->start.line && d.endLine <= child.position->end.line) {
                        pending.push_back(&d);
                    }
                }
                continue;
            }
            if (child.type == NodeType::Code) {
                EnhanceCode(child, pending, extraction);
            } else if (!child.children.empty()) {
                EnhanceChildren(child, extraction);
            }
            pending.clear();
        }
    }
}

AstNode AstEnhancer::Enhance(AstNode root, const Extraction& extraction) {
    EnhanceChildren(root, extraction);
    return root;
}

} // namespace polyglot::domain::markdown
