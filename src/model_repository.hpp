#ifndef MODEL_REPOSITORY_HPP
#define MODEL_REPOSITORY_HPP

#include "network.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ModelMetadata
{
    std::string network_id;
    std::vector<int> architecture;
    std::vector<std::pair<int, int>> weight_shapes;
    std::vector<std::pair<int, int>> bias_shapes;
    bool trained;
    std::optional<double> accuracy;
};

struct StoredModel
{
    Network network;
    ModelMetadata metadata;
};

// Saved networks, one "<id>.json" document each. Parameters are written with
// enough digits to round-trip, so a reloaded network gives bit-identical
// predictions.
class ModelRepository
{
public:
    explicit ModelRepository(std::filesystem::path directory);

    [[nodiscard]] const std::filesystem::path &directory() const noexcept
    {
        return m_directory;
    }

    void save(const Network &network,
              const std::string &network_id,
              bool trained,
              std::optional<double> accuracy) const;

    [[nodiscard]] std::optional<StoredModel>
    load(const std::string &network_id) const;

    [[nodiscard]] bool contains(const std::string &network_id) const;

    // Sorted by id. Files that cannot be read are skipped.
    [[nodiscard]] std::vector<ModelMetadata> list() const;

    // Ids of every model file, readable or not, sorted
    [[nodiscard]] std::vector<std::string> ids() const;

    // Returns false if there was nothing to delete
    bool remove(const std::string &network_id) const;

private:
    [[nodiscard]] std::filesystem::path
    model_path(const std::string &network_id) const;

    std::filesystem::path m_directory;
};

[[nodiscard]] bool is_valid_network_id(const std::string &network_id);

#endif // MODEL_REPOSITORY_HPP
