#pragma once

#include "id_remap_table.h"
#include "json_io.h"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace CitySeq::Core::Model {

using Color3 = std::array<double, 3>;
using Color4 = std::array<double, 4>;
using TextureVertex = std::array<double, 2>;

struct MaterialObject {
    std::string name;
    std::optional<double> ambientIntensity;
    std::optional<Color3> diffuseColor;
    std::optional<Color3> emissiveColor;
    std::optional<Color3> specularColor;
    std::optional<double> shininess;
    std::optional<double> transparency;
    std::optional<bool> isSmooth;
    Json extra = Json::object();

    /**
     * Check that every intensity, colour channel, shininess and transparency
     * lies in [0, 1].
     * @throws SeqError(InvalidValue) naming the offending field
     */
    void validate() const;

    bool operator==(const MaterialObject& other) const;

    static MaterialObject fromJson(const Json& j);
    Json toJson() const;
};

struct TextureObject {
    std::string type;
    std::string image;
    std::optional<std::string> wrapMode;
    std::optional<std::string> textureType;
    std::optional<Color4> borderColor;
    Json extra = Json::object();

    void validate() const;

    bool operator==(const TextureObject& other) const;

    static TextureObject fromJson(const Json& j);
    Json toJson() const;
};

/**
 * Materials, textures and texture vertices shared by the geometries of a
 * document or feature.
 */
class Appearance {
public:
    std::vector<MaterialObject> materials;
    std::vector<TextureObject> textures;
    std::vector<TextureVertex> verticesTexture;
    std::optional<std::string> defaultThemeMaterial;
    std::optional<std::string> defaultThemeTexture;

    /**
     * Insert a material, reusing an existing entry with the same name.
     * @return index of the stored material
     * @throws SeqError(InvalidValue) if the material fails validation
     */
    std::size_t addMaterial(const MaterialObject& material);

    /**
     * Insert a texture, reusing an existing entry with the same image.
     */
    std::size_t addTexture(const TextureObject& texture);

    /**
     * Append texture vertices verbatim.
     * @return index of the first appended vertex
     */
    std::size_t addTextureVertices(const std::vector<TextureVertex>& uvs);

    /**
     * Project this catalog through renumbering tables: entry new of the result
     * is entry old of this one for every (old, new) pair of a table.
     * @throws SeqError(InvalidValue) if a table references a missing entry
     */
    Appearance slice(const IdRemapTable& materialTable,
                     const IdRemapTable& textureTable,
                     const IdRemapTable& uvTable) const;

    bool empty() const {
        return materials.empty() && textures.empty() && verticesTexture.empty();
    }

    static Appearance fromJson(const Json& j);
    Json toJson() const;

    Json extra = Json::object();
};

}
