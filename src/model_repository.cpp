#include "model_repository.hpp"

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <system_error>

namespace
{

constexpr const char *file_format {"neural_digits.model"};
constexpr int file_version {1};
constexpr const char *file_extension {".json"};

void check_network_id(const std::string &network_id)
{
    if (!is_valid_network_id(network_id))
    {
        throw PersistenceError("Invalid network id \"" + network_id + '"');
    }
}

// Rows of the matrix, so that the document reads like the matrix it stores
[[nodiscard]] nlohmann::json to_json(const Eigen::MatrixXf &matrix)
{
    auto rows = nlohmann::json::array();
    for (Eigen::Index i {0}; i < matrix.rows(); ++i)
    {
        auto row = nlohmann::json::array();
        for (Eigen::Index j {0}; j < matrix.cols(); ++j)
        {
            row.push_back(matrix(i, j));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

[[nodiscard]] nlohmann::json to_json(const Eigen::VectorXf &vector)
{
    auto values = nlohmann::json::array();
    for (Eigen::Index i {0}; i < vector.size(); ++i)
    {
        values.push_back(vector(i));
    }
    return values;
}

[[nodiscard]] nlohmann::json parse_file(const std::filesystem::path &path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw PersistenceError("Failed to open " + path.string());
    }
    try
    {
        return nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw PersistenceError("Failed to parse " + path.string() + ": " +
                               e.what());
    }
}

[[nodiscard]] ModelMetadata read_metadata(const nlohmann::json &document,
                                          const std::filesystem::path &path)
{
    if (!document.is_object() ||
        document.value("format", std::string {}) != file_format)
    {
        throw PersistenceError(path.string() + " is not a model file");
    }
    const auto version = document.at("version").get<int>();
    if (version != file_version)
    {
        throw PersistenceError("Unsupported model file version " +
                               std::to_string(version) + " in " +
                               path.string());
    }

    ModelMetadata metadata {.network_id = path.stem().string(),
                            .architecture = {},
                            .weight_shapes = {},
                            .bias_shapes = {},
                            .trained = document.at("trained").get<bool>(),
                            .accuracy = {}};
    const auto &accuracy = document.at("accuracy");
    if (!accuracy.is_null())
    {
        metadata.accuracy = accuracy.get<double>();
    }

    metadata.architecture =
        document.at("architecture").get<std::vector<int>>();
    if (metadata.architecture.size() < 2)
    {
        throw PersistenceError("Invalid number of layers " +
                               std::to_string(metadata.architecture.size()) +
                               " in " + path.string());
    }
    for (const auto size : metadata.architecture)
    {
        if (size <= 0)
        {
            throw PersistenceError("Invalid layer size " +
                                   std::to_string(size) + " in " +
                                   path.string());
        }
    }
    for (std::size_t l {0}; l + 1 < metadata.architecture.size(); ++l)
    {
        metadata.weight_shapes.emplace_back(metadata.architecture[l + 1],
                                            metadata.architecture[l]);
        metadata.bias_shapes.emplace_back(metadata.architecture[l + 1], 1);
    }
    return metadata;
}

[[nodiscard]] ModelMetadata
read_metadata_file(const std::filesystem::path &path)
{
    const auto document = parse_file(path);
    try
    {
        return read_metadata(document, path);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw PersistenceError("Invalid model file " + path.string() + ": " +
                               e.what());
    }
}

[[nodiscard]] Eigen::MatrixXf read_matrix(const nlohmann::json &rows,
                                          int num_rows,
                                          int num_cols,
                                          const std::filesystem::path &path)
{
    const auto values = rows.get<std::vector<std::vector<float>>>();
    if (values.size() != static_cast<std::size_t>(num_rows))
    {
        throw PersistenceError("Weight matrix with " +
                               std::to_string(values.size()) +
                               " rows in " + path.string() + ", expected " +
                               std::to_string(num_rows));
    }
    Eigen::MatrixXf matrix(num_rows, num_cols);
    for (int i {0}; i < num_rows; ++i)
    {
        const auto &row = values[static_cast<std::size_t>(i)];
        if (row.size() != static_cast<std::size_t>(num_cols))
        {
            throw PersistenceError("Weight matrix row of size " +
                                   std::to_string(row.size()) + " in " +
                                   path.string() + ", expected " +
                                   std::to_string(num_cols));
        }
        for (int j {0}; j < num_cols; ++j)
        {
            matrix(i, j) = row[static_cast<std::size_t>(j)];
        }
    }
    return matrix;
}

[[nodiscard]] Eigen::VectorXf read_vector(const nlohmann::json &values,
                                          int size,
                                          const std::filesystem::path &path)
{
    const auto data = values.get<std::vector<float>>();
    if (data.size() != static_cast<std::size_t>(size))
    {
        throw PersistenceError("Bias vector of size " +
                               std::to_string(data.size()) + " in " +
                               path.string() + ", expected " +
                               std::to_string(size));
    }
    return Eigen::Map<const Eigen::VectorXf>(data.data(), size);
}

} // namespace

bool is_valid_network_id(const std::string &network_id)
{
    return !network_id.empty() &&
           std::all_of(network_id.begin(),
                       network_id.end(),
                       [](unsigned char c)
                       { return std::isalnum(c) || c == '-' || c == '_'; });
}

ModelRepository::ModelRepository(std::filesystem::path directory)
    : m_directory(std::move(directory))
{
}

std::filesystem::path
ModelRepository::model_path(const std::string &network_id) const
{
    check_network_id(network_id);
    return m_directory / (network_id + file_extension);
}

void ModelRepository::save(const Network &network,
                           const std::string &network_id,
                           bool trained,
                           std::optional<double> accuracy) const
{
    const auto path = model_path(network_id);

    std::error_code error;
    std::filesystem::create_directories(m_directory, error);
    if (error)
    {
        throw PersistenceError("Failed to create " + m_directory.string() +
                               ": " + error.message());
    }

    nlohmann::json document;
    document["format"] = file_format;
    document["version"] = file_version;
    document["network_id"] = network_id;
    document["architecture"] = network.sizes();
    document["trained"] = trained;
    document["accuracy"] =
        accuracy ? nlohmann::json(*accuracy) : nlohmann::json(nullptr);

    auto weight_shapes = nlohmann::json::array();
    auto bias_shapes = nlohmann::json::array();
    auto weights = nlohmann::json::array();
    auto biases = nlohmann::json::array();
    for (std::size_t l {0}; l < network.weights().size(); ++l)
    {
        const auto &w = network.weights()[l];
        const auto &b = network.biases()[l];
        weight_shapes.push_back(nlohmann::json::array({w.rows(), w.cols()}));
        bias_shapes.push_back(nlohmann::json::array({b.size(), 1}));
        weights.push_back(to_json(w));
        biases.push_back(to_json(b));
    }
    document["weight_shapes"] = std::move(weight_shapes);
    document["bias_shapes"] = std::move(bias_shapes);
    document["weights"] = std::move(weights);
    document["biases"] = std::move(biases);

    // Written next to the destination and renamed, so that readers never see
    // a partial file
    auto temporary_path = path;
    temporary_path += ".tmp";
    {
        std::ofstream file(temporary_path, std::ios::trunc);
        if (!file)
        {
            throw PersistenceError("Failed to open " +
                                   temporary_path.string());
        }
        file << document.dump();
        file.close();
        if (!file)
        {
            throw PersistenceError("Failed to write " +
                                   temporary_path.string());
        }
    }

    std::filesystem::rename(temporary_path, path, error);
    if (error)
    {
        throw PersistenceError("Failed to write " + path.string() + ": " +
                               error.message());
    }
}

std::optional<StoredModel>
ModelRepository::load(const std::string &network_id) const
{
    const auto path = model_path(network_id);
    if (!std::filesystem::exists(path))
    {
        return std::nullopt;
    }

    const auto document = parse_file(path);
    try
    {
        auto metadata = read_metadata(document, path);
        const auto &sizes = metadata.architecture;
        const auto num_transitions = sizes.size() - 1;

        const auto &weights_json = document.at("weights");
        const auto &biases_json = document.at("biases");
        if (!weights_json.is_array() || !biases_json.is_array() ||
            weights_json.size() != num_transitions ||
            biases_json.size() != num_transitions)
        {
            throw PersistenceError("Expected " +
                                   std::to_string(num_transitions) +
                                   " weight matrices and bias vectors in " +
                                   path.string());
        }

        std::vector<Eigen::MatrixXf> weights;
        std::vector<Eigen::VectorXf> biases;
        for (std::size_t l {0}; l < num_transitions; ++l)
        {
            weights.push_back(
                read_matrix(weights_json[l], sizes[l + 1], sizes[l], path));
            biases.push_back(read_vector(biases_json[l], sizes[l + 1], path));
        }

        return StoredModel {
            .network = Network(sizes, std::move(weights), std::move(biases)),
            .metadata = std::move(metadata)};
    }
    catch (const nlohmann::json::exception &e)
    {
        throw PersistenceError("Invalid model file " + path.string() + ": " +
                               e.what());
    }
}

bool ModelRepository::contains(const std::string &network_id) const
{
    return std::filesystem::exists(model_path(network_id));
}

std::vector<std::string> ModelRepository::ids() const
{
    std::vector<std::string> result;
    if (!std::filesystem::is_directory(m_directory))
    {
        return result;
    }

    for (const auto &entry : std::filesystem::directory_iterator(m_directory))
    {
        if (!entry.is_regular_file() ||
            entry.path().extension() != file_extension)
        {
            continue;
        }
        auto network_id = entry.path().stem().string();
        if (is_valid_network_id(network_id))
        {
            result.push_back(std::move(network_id));
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ModelMetadata> ModelRepository::list() const
{
    std::vector<ModelMetadata> result;
    for (const auto &network_id : ids())
    {
        try
        {
            result.push_back(read_metadata_file(model_path(network_id)));
        }
        catch (const PersistenceError &)
        {
            // Unreadable files stay visible through ids()
            continue;
        }
    }
    return result;
}

bool ModelRepository::remove(const std::string &network_id) const
{
    const auto path = model_path(network_id);
    std::error_code error;
    const auto removed = std::filesystem::remove(path, error);
    if (error)
    {
        throw PersistenceError("Failed to delete " + path.string() + ": " +
                               error.message());
    }
    return removed;
}
