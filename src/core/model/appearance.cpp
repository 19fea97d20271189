#include "appearance.h"
#include <fmt/format.h>

namespace CitySeq::Core::Model {

namespace {

void checkUnit(double value, const char* owner, const char* field) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw SeqError(ErrorKind::InvalidValue,
                       fmt::format("{} {} value {} is outside [0, 1]", owner, field, value));
    }
}

template <std::size_t N>
void checkUnit(const std::optional<std::array<double, N>>& color, const char* owner, const char* field) {
    if (!color) {
        return;
    }
    for (double channel : *color) {
        checkUnit(channel, owner, field);
    }
}

void checkUnit(const std::optional<double>& value, const char* owner, const char* field) {
    if (value) {
        checkUnit(*value, owner, field);
    }
}

template <std::size_t N>
std::optional<std::array<double, N>> colorField(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_array() || it->size() != N) {
        throw SeqError(ErrorKind::MalformedJson, fmt::format("\"{}\" must hold {} numbers", key, N));
    }
    std::array<double, N> color{};
    for (std::size_t i = 0; i < N; ++i) {
        color[i] = (*it)[i].template get<double>();
    }
    return color;
}

// Copy entries of source into a vector indexed by the table's new ids.
template <typename T>
std::vector<T> sliceThrough(const std::vector<T>& source, const IdRemapTable& table, const char* what) {
    std::vector<T> out(table.span());
    for (const auto& [oldId, newId] : table.entries()) {
        if (oldId >= source.size()) {
            throw SeqError(ErrorKind::InvalidValue,
                           fmt::format("{} index {} out of range ({} entries)", what, oldId, source.size()));
        }
        out[newId] = source[oldId];
    }
    return out;
}

}

void MaterialObject::validate() const {
    checkUnit(ambientIntensity, "material", "ambientIntensity");
    checkUnit(diffuseColor, "material", "diffuseColor");
    checkUnit(emissiveColor, "material", "emissiveColor");
    checkUnit(specularColor, "material", "specularColor");
    checkUnit(shininess, "material", "shininess");
    checkUnit(transparency, "material", "transparency");
}

bool MaterialObject::operator==(const MaterialObject& other) const {
    return name == other.name && ambientIntensity == other.ambientIntensity &&
           diffuseColor == other.diffuseColor && emissiveColor == other.emissiveColor &&
           specularColor == other.specularColor && shininess == other.shininess &&
           transparency == other.transparency && isSmooth == other.isSmooth &&
           extra == other.extra;
}

MaterialObject MaterialObject::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "material is not an object");
    }
    MaterialObject m;
    m.name = requireField(j, "name", "material").get<std::string>();
    m.ambientIntensity = optionalField<double>(j, "ambientIntensity");
    m.diffuseColor = colorField<3>(j, "diffuseColor");
    m.emissiveColor = colorField<3>(j, "emissiveColor");
    m.specularColor = colorField<3>(j, "specularColor");
    m.shininess = optionalField<double>(j, "shininess");
    m.transparency = optionalField<double>(j, "transparency");
    m.isSmooth = optionalField<bool>(j, "isSmooth");
    m.extra = extraMembers(j, {"name", "ambientIntensity", "diffuseColor", "emissiveColor",
                               "specularColor", "shininess", "transparency", "isSmooth"});
    return m;
}

Json MaterialObject::toJson() const {
    Json j = Json::object();
    j["name"] = name;
    putOptional(j, "ambientIntensity", ambientIntensity);
    putOptional(j, "diffuseColor", diffuseColor);
    putOptional(j, "emissiveColor", emissiveColor);
    putOptional(j, "specularColor", specularColor);
    putOptional(j, "shininess", shininess);
    putOptional(j, "transparency", transparency);
    putOptional(j, "isSmooth", isSmooth);
    appendExtraMembers(j, extra);
    return j;
}

void TextureObject::validate() const {
    checkUnit(borderColor, "texture", "borderColor");
}

bool TextureObject::operator==(const TextureObject& other) const {
    return type == other.type && image == other.image && wrapMode == other.wrapMode &&
           textureType == other.textureType && borderColor == other.borderColor &&
           extra == other.extra;
}

TextureObject TextureObject::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "texture is not an object");
    }
    TextureObject t;
    t.type = requireField(j, "type", "texture").get<std::string>();
    t.image = requireField(j, "image", "texture").get<std::string>();
    t.wrapMode = optionalField<std::string>(j, "wrapMode");
    t.textureType = optionalField<std::string>(j, "textureType");
    t.borderColor = colorField<4>(j, "borderColor");
    t.extra = extraMembers(j, {"type", "image", "wrapMode", "textureType", "borderColor"});
    return t;
}

Json TextureObject::toJson() const {
    Json j = Json::object();
    j["type"] = type;
    j["image"] = image;
    putOptional(j, "wrapMode", wrapMode);
    putOptional(j, "textureType", textureType);
    putOptional(j, "borderColor", borderColor);
    appendExtraMembers(j, extra);
    return j;
}

std::size_t Appearance::addMaterial(const MaterialObject& material) {
    material.validate();
    for (std::size_t i = 0; i < materials.size(); ++i) {
        if (materials[i].name == material.name) {
            return i;
        }
    }
    materials.push_back(material);
    return materials.size() - 1;
}

std::size_t Appearance::addTexture(const TextureObject& texture) {
    texture.validate();
    for (std::size_t i = 0; i < textures.size(); ++i) {
        if (textures[i].image == texture.image) {
            return i;
        }
    }
    textures.push_back(texture);
    return textures.size() - 1;
}

std::size_t Appearance::addTextureVertices(const std::vector<TextureVertex>& uvs) {
    std::size_t first = verticesTexture.size();
    verticesTexture.insert(verticesTexture.end(), uvs.begin(), uvs.end());
    return first;
}

Appearance Appearance::slice(const IdRemapTable& materialTable,
                             const IdRemapTable& textureTable,
                             const IdRemapTable& uvTable) const {
    Appearance out;
    out.materials = sliceThrough(materials, materialTable, "material");
    out.textures = sliceThrough(textures, textureTable, "texture");
    out.verticesTexture = sliceThrough(verticesTexture, uvTable, "texture vertex");
    out.defaultThemeMaterial = defaultThemeMaterial;
    out.defaultThemeTexture = defaultThemeTexture;
    out.extra = extra;
    return out;
}

Appearance Appearance::fromJson(const Json& j) {
    if (!j.is_object()) {
        throw SeqError(ErrorKind::MalformedJson, "\"appearance\" is not an object");
    }
    Appearance a;
    if (auto it = j.find("materials"); it != j.end() && it->is_array()) {
        for (const auto& m : *it) {
            a.materials.push_back(MaterialObject::fromJson(m));
        }
    }
    if (auto it = j.find("textures"); it != j.end() && it->is_array()) {
        for (const auto& t : *it) {
            a.textures.push_back(TextureObject::fromJson(t));
        }
    }
    if (auto it = j.find("vertices-texture"); it != j.end() && it->is_array()) {
        a.verticesTexture.reserve(it->size());
        for (const auto& uv : *it) {
            if (!uv.is_array() || uv.size() < 2) {
                throw SeqError(ErrorKind::MalformedJson, "texture vertex is not a [u,v] pair");
            }
            a.verticesTexture.push_back(TextureVertex{uv[0].get<double>(), uv[1].get<double>()});
        }
    }
    a.defaultThemeMaterial = optionalField<std::string>(j, "default-theme-material");
    a.defaultThemeTexture = optionalField<std::string>(j, "default-theme-texture");
    a.extra = extraMembers(j, {"materials", "textures", "vertices-texture",
                               "default-theme-material", "default-theme-texture"});
    return a;
}

Json Appearance::toJson() const {
    Json j = Json::object();
    if (!materials.empty()) {
        Json arr = Json::array();
        for (const auto& m : materials) {
            arr.push_back(m.toJson());
        }
        j["materials"] = std::move(arr);
    }
    if (!textures.empty()) {
        Json arr = Json::array();
        for (const auto& t : textures) {
            arr.push_back(t.toJson());
        }
        j["textures"] = std::move(arr);
    }
    if (!verticesTexture.empty()) {
        Json arr = Json::array();
        for (const auto& uv : verticesTexture) {
            arr.push_back({uv[0], uv[1]});
        }
        j["vertices-texture"] = std::move(arr);
    }
    putOptional(j, "default-theme-material", defaultThemeMaterial);
    putOptional(j, "default-theme-texture", defaultThemeTexture);
    appendExtraMembers(j, extra);
    return j;
}

}
