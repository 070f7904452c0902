#include "mnist.hpp"

#include "errors.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <string>

namespace
{

constexpr std::uint32_t idx_labels_magic {0x00000801};
constexpr std::uint32_t idx_images_magic {0x00000803};

[[nodiscard]] std::vector<std::uint8_t>
read_file(const std::filesystem::path &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw DatasetError("Failed to open " + path.string());
    }
    return {std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()};
}

// IDX headers are stored big-endian
[[nodiscard]] std::uint32_t read_u32(const std::vector<std::uint8_t> &data,
                                     std::size_t offset,
                                     const std::filesystem::path &path)
{
    if (data.size() < offset + 4)
    {
        throw DatasetError("Truncated IDX header in " + path.string());
    }
    return (static_cast<std::uint32_t>(data[offset]) << 24) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
           static_cast<std::uint32_t>(data[offset + 3]);
}

[[nodiscard]] std::vector<EvaluationExample>
make_evaluation_examples(const IdxImages &images,
                         const std::vector<std::uint8_t> &labels,
                         Eigen::Index begin,
                         Eigen::Index end)
{
    std::vector<EvaluationExample> examples;
    examples.reserve(static_cast<std::size_t>(end - begin));
    for (auto i = begin; i < end; ++i)
    {
        examples.push_back({.input = images.pixels.col(i),
                            .label = labels[static_cast<std::size_t>(i)]});
    }
    return examples;
}

void check_labels(const IdxImages &images,
                  const std::vector<std::uint8_t> &labels,
                  const std::filesystem::path &path)
{
    if (static_cast<Eigen::Index>(labels.size()) != images.pixels.cols())
    {
        throw DatasetError(path.string() + " has " +
                           std::to_string(labels.size()) +
                           " labels but there are " +
                           std::to_string(images.pixels.cols()) + " images");
    }
    for (const auto label : labels)
    {
        if (label >= mnist_num_classes)
        {
            throw DatasetError("Invalid label " + std::to_string(label) +
                               " in " + path.string());
        }
    }
}

} // namespace

IdxImages load_idx_images(const std::filesystem::path &path)
{
    const auto data = read_file(path);

    const auto magic = read_u32(data, 0, path);
    if (magic != idx_images_magic)
    {
        throw DatasetError(path.string() + " is not an IDX image file");
    }
    const auto count = read_u32(data, 4, path);
    const auto height = read_u32(data, 8, path);
    const auto width = read_u32(data, 12, path);

    // Also bounds image_size * count below 2^63
    constexpr auto max_dimension =
        static_cast<std::size_t>(std::numeric_limits<int>::max());
    constexpr std::size_t header_size {16};
    const auto image_size = static_cast<std::size_t>(width) * height;
    if (width == 0 || height == 0 || width > max_dimension ||
        height > max_dimension || image_size > max_dimension)
    {
        throw DatasetError("Invalid image size " + std::to_string(width) +
                           " x " + std::to_string(height) + " in " +
                           path.string());
    }
    if (data.size() != header_size + image_size * count)
    {
        throw DatasetError("Unexpected size of " + path.string() + " for " +
                           std::to_string(count) + " images of " +
                           std::to_string(width) + " x " +
                           std::to_string(height) + " pixels");
    }

    IdxImages images {.width = static_cast<int>(width),
                      .height = static_cast<int>(height),
                      .pixels = {}};
    images.pixels.resize(static_cast<Eigen::Index>(image_size),
                         static_cast<Eigen::Index>(count));
    for (std::size_t i {0}; i < count; ++i)
    {
        for (std::size_t j {0}; j < image_size; ++j)
        {
            images.pixels(static_cast<Eigen::Index>(j),
                          static_cast<Eigen::Index>(i)) =
                static_cast<float>(data[header_size + i * image_size + j]) /
                255.0f;
        }
    }
    return images;
}

std::vector<std::uint8_t> load_idx_labels(const std::filesystem::path &path)
{
    auto data = read_file(path);

    const auto magic = read_u32(data, 0, path);
    if (magic != idx_labels_magic)
    {
        throw DatasetError(path.string() + " is not an IDX label file");
    }
    const auto count = read_u32(data, 4, path);

    constexpr std::size_t header_size {8};
    if (data.size() != header_size + count)
    {
        throw DatasetError("Unexpected size of " + path.string() + " for " +
                           std::to_string(count) + " labels");
    }
    data.erase(data.begin(), data.begin() + header_size);
    return data;
}

Eigen::VectorXf one_hot(int label, int num_classes)
{
    if (label < 0 || label >= num_classes)
    {
        throw DimensionMismatch("Label " + std::to_string(label) +
                                " is out of range for " +
                                std::to_string(num_classes) + " classes");
    }
    Eigen::VectorXf result = Eigen::VectorXf::Zero(num_classes);
    result(label) = 1.0f;
    return result;
}

MnistData load_mnist(const std::filesystem::path &directory,
                     int validation_size)
{
    const auto training_images =
        load_idx_images(directory / "train-images-idx3-ubyte");
    const auto training_labels_path = directory / "train-labels-idx1-ubyte";
    const auto training_labels = load_idx_labels(training_labels_path);
    check_labels(training_images, training_labels, training_labels_path);

    const auto test_images =
        load_idx_images(directory / "t10k-images-idx3-ubyte");
    const auto test_labels_path = directory / "t10k-labels-idx1-ubyte";
    const auto test_labels = load_idx_labels(test_labels_path);
    check_labels(test_images, test_labels, test_labels_path);

    const auto num_training_images = training_images.pixels.cols();
    if (validation_size < 0 || validation_size >= num_training_images)
    {
        throw DatasetError("Invalid validation size of " +
                           std::to_string(validation_size) + " for " +
                           std::to_string(num_training_images) +
                           " training images");
    }
    const auto num_training = num_training_images - validation_size;

    MnistData dataset;
    dataset.training.reserve(static_cast<std::size_t>(num_training));
    for (Eigen::Index i {0}; i < num_training; ++i)
    {
        dataset.training.push_back(
            {.input = training_images.pixels.col(i),
             .target_output =
                 one_hot(training_labels[static_cast<std::size_t>(i)],
                         mnist_num_classes)});
    }
    dataset.validation = make_evaluation_examples(
        training_images, training_labels, num_training, num_training_images);
    dataset.test = make_evaluation_examples(
        test_images, test_labels, 0, test_images.pixels.cols());
    return dataset;
}
