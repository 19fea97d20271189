#include "merge_engine.h"
#include "log.h"
#include <fmt/format.h>
#include <istream>
#include <string>

namespace CitySeq::Core::Seq {

using namespace CitySeq::Core::Model;

MergeEngine::MergeEngine(const MergeSettings& settings)
    : settings_(settings) {
}

void MergeEngine::begin(const CityDocument& header) {
    header.checkSupported();
    document_ = header.emptyCopy();
    document_.appearance = header.appearance;
    tables_.clear();
    featureCount_ = 0;
    started_ = true;
}

void MergeEngine::addFeature(CityFeature feature, const std::optional<Transform>& source) {
    if (!started_) {
        throw SeqError(ErrorKind::UnsupportedOperation, "feature received before the header");
    }

    tables_.clear();
    if (feature.appearance) {
        const Appearance& app = *feature.appearance;
        for (std::size_t i = 0; i < app.materials.size(); ++i) {
            tables_.materials.record(i, document_.addMaterial(app.materials[i]));
        }
        for (std::size_t i = 0; i < app.textures.size(); ++i) {
            tables_.textures.record(i, document_.addTexture(app.textures[i]));
        }
        if (!app.verticesTexture.empty()) {
            std::size_t base = document_.addTextureVertices(app.verticesTexture);
            for (std::size_t i = 0; i < app.verticesTexture.size(); ++i) {
                tables_.uvs.record(i, base + i);
            }
        }
        // The first feature naming a default theme sets it for the document.
        if (app.defaultThemeMaterial || app.defaultThemeTexture) {
            if (!document_.appearance) {
                document_.appearance.emplace();
            }
            Appearance& target = *document_.appearance;
            if (!target.defaultThemeMaterial) {
                target.defaultThemeMaterial = app.defaultThemeMaterial;
            }
            if (!target.defaultThemeTexture) {
                target.defaultThemeTexture = app.defaultThemeTexture;
            }
        }
    }

    std::size_t vertexOffset = document_.vertices.size();
    for (auto& [id, co] : feature.cityObjects) {
        if (co.geometry) {
            for (auto& g : *co.geometry) {
                g.offsetVertices(vertexOffset);
                g.renumberMaterials(tables_.materials);
                g.renumberTextures(tables_.textures, tables_.uvs);
            }
        }
        if (document_.cityObjects.contains(id)) {
            LOG_W("CityObject \"%s\" appears in more than one feature, keeping the last one", id.c_str());
        }
        document_.addCityObject(id, std::move(co));
    }

    if (source && !(*source == document_.transform)) {
        for (auto& v : feature.vertices) {
            v = document_.transform.requantize(v, *source);
        }
    }
    document_.appendVertices(feature.vertices);
    ++featureCount_;
}

CityDocument MergeEngine::finish() {
    std::size_t before = document_.vertices.size();
    if (settings_.removeDuplicateVertices) {
        document_.removeDuplicateVertices();
    }
    if (settings_.renormalizeTransform) {
        document_.updateTransform();
    }
    LOG_I("collect: merged %zu features, %zu CityObjects, vertices %zu -> %zu",
          featureCount_, document_.cityObjects.size(), before, document_.vertices.size());
    started_ = false;
    return std::move(document_);
}

CityDocument collect(const std::vector<std::istream*>& inputs, const MergeSettings& settings) {
    MergeEngine engine(settings);
    bool haveTarget = false;
    for (std::size_t s = 0; s < inputs.size(); ++s) {
        std::istream& in = *inputs[s];
        std::optional<Transform> source;
        bool haveHeader = false;
        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (line.empty()) {
                continue;
            }
            try {
                if (!haveHeader) {
                    CityDocument header = CityDocument::parse(line);
                    if (!haveTarget) {
                        engine.begin(header);
                        haveTarget = true;
                    } else {
                        header.checkSupported();
                        source = header.transform;
                        LOG_D("stream %zu: re-quantizing from %s to %s", s + 1,
                              source->toString().c_str(),
                              engine.document().transform.toString().c_str());
                    }
                    haveHeader = true;
                    continue;
                }
                engine.addFeature(CityFeature::parse(line), source);
            } catch (const SeqError& e) {
                throw SeqError(e.kind(), fmt::format("stream {} line {}: {}", s + 1, lineNo, e.detail()));
            }
        }
        if (in.bad()) {
            throw SeqError(ErrorKind::Io, fmt::format("failed to read stream {}", s + 1));
        }
    }
    if (!haveTarget) {
        throw SeqError(ErrorKind::MalformedJson, "input holds no CityJSONSeq header");
    }
    return engine.finish();
}

}
