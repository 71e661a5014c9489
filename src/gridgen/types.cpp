/// @file types.cpp
/// @brief Core type helpers for mcv_gridgen module

#include <mcvillage/gridgen/types.hpp>

namespace mcv_gridgen {

const char* plant_prefab_type_name(PlantPrefabType type) {
    switch (type) {
        case PlantPrefabType::Any: return "Any";
        case PlantPrefabType::Single: return "Single";
        case PlantPrefabType::Double: return "Double";
        case PlantPrefabType::Crop: return "Crop";
    }
    return "Any";
}

std::optional<PlantPrefabType> parse_plant_prefab_type(const std::string& name) {
    if (name == "Any" || name == "any") return PlantPrefabType::Any;
    if (name == "Single" || name == "single") return PlantPrefabType::Single;
    if (name == "Double" || name == "double") return PlantPrefabType::Double;
    if (name == "Crop" || name == "crop") return PlantPrefabType::Crop;
    return std::nullopt;
}

} // namespace mcv_gridgen
