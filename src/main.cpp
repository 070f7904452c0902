#include "errors.hpp"
#include "inspection.hpp"
#include "mnist.hpp"
#include "model_repository.hpp"
#include "network.hpp"
#include "session_store.hpp"
#include "training.hpp"

// NOTE: clipp uses std::result_of, but it is removed in C++20. GCC did not
// remove it yet, so just define it for MSVC.
#ifdef _MSC_VER
namespace std
{
template <class>
struct result_of;
template <class F, class... ArgTypes>
struct result_of<F(ArgTypes...)> : std::invoke_result<F, ArgTypes...>
{
};
} // namespace std
#endif
#include "clipp.h"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <cstdlib>

namespace
{

enum class Mode
{
    none,
    train,
    list,
    remove,
    inspect
};

struct Parameters
{
    Mode mode;
    std::string data_directory;
    std::string models_directory;
    std::string output_directory;
    std::string network_id;
    std::vector<int> layer_sizes;
    int num_epochs;
    int batch_size;
    float learning_rate;
    bool has_seed;
    unsigned int seed;
    bool delete_all;
};

class ConsoleObserver final : public TrainingObserver
{
public:
    void on_epoch(const TrainingUpdate &update) override
    {
        const auto &report = update.report;
        if (report.correct && report.total)
        {
            std::cout << "Epoch " << report.epoch << ": " << *report.correct
                      << " / " << *report.total;
        }
        else
        {
            std::cout << "Epoch " << report.epoch << " complete";
        }
        std::cout << " (" << std::fixed << std::setprecision(1)
                  << report.elapsed_time << " s, " << std::setprecision(0)
                  << update.progress << "%)" << std::defaultfloat
                  << std::setprecision(6) << std::endl;
    }

    void on_complete(const std::string &,
                     const std::string &network_id,
                     std::optional<double> accuracy) override
    {
        std::cout << "Training of " << network_id << " completed";
        if (accuracy)
        {
            std::cout << ", accuracy " << std::fixed << std::setprecision(2)
                      << 100.0 * *accuracy << '%' << std::defaultfloat
                      << std::setprecision(6);
        }
        std::cout << std::endl;
    }

    void on_error(const std::string &,
                  const std::string &network_id,
                  const std::string &message) override
    {
        std::cerr << "Training of " << network_id << " failed: " << message
                  << std::endl;
    }
};

void print_error(const clipp::parsing_result &result,
                 const std::vector<std::string> &unmatched,
                 const clipp::group &cli,
                 const std::string &executable_name)
{
    if (!unmatched.empty())
    {
        std::cerr << "Unmatched extra arguments:";
        for (const auto &arg : unmatched)
        {
            std::cerr << " \"" << arg << '\"';
        }
        std::cerr << '\n';
    }

    for (const auto &arg : result.missing())
    {
        if (!arg.param()->label().empty())
        {
            std::cerr << "Missing parameter \"" << arg.param()->label()
                      << "\" after index " << arg.after_index() << '\n';
        }
    }

    for (const auto &arg : result)
    {
        if (arg.any_error())
        {
            std::cerr << "Error at argument " << arg.index() << " \""
                      << arg.arg() << "\"\n";
        }
    }

    std::cerr << "Usage:\n" << clipp::usage_lines(cli, executable_name) << '\n';
}

[[nodiscard]] Parameters parse_command_line(int argc, char *argv[])
{
    Parameters params {.mode = Mode::none,
                       .data_directory = {},
                       .models_directory = "models",
                       .output_directory = {},
                       .network_id = {},
                       .layer_sizes = {},
                       .num_epochs = 5,
                       .batch_size = 10,
                       .learning_rate = 3.0f,
                       .has_seed = false,
                       .seed = 0,
                       .delete_all = false};

    bool show_help {false};
    std::vector<std::string> unmatched;

    const auto data_option = [&]
    {
        return (clipp::required("-d", "--data") &
                clipp::value(clipp::match::prefix_not("-"),
                             "data",
                             params.data_directory))
            .doc("Directory containing the MNIST files "
                 "(train-images-idx3-ubyte, train-labels-idx1-ubyte, "
                 "t10k-images-idx3-ubyte, t10k-labels-idx1-ubyte)");
    };
    const auto models_option = [&]
    {
        return (clipp::option("-m", "--models") &
                clipp::value(clipp::match::prefix_not("-"),
                             "models",
                             params.models_directory))
            .doc("Directory of the saved networks (default: " +
                 params.models_directory + ")");
    };
    const auto output_option = [&]
    {
        return (clipp::option("-o", "--output") &
                clipp::value(clipp::match::prefix_not("-"),
                             "output",
                             params.output_directory))
            .doc("Directory where PNG visualizations are written");
    };
    const auto seed_option = [&]
    {
        return (clipp::option("-s", "--seed").set(params.has_seed) &
                clipp::value(clipp::match::integers(), "seed", params.seed))
            .doc("Seed of the random number generator (default: random)");
    };

    const auto train_cli =
        (clipp::command("train").set(params.mode, Mode::train),
         data_option(),
         (clipp::option("-a", "--arch") &
          clipp::values(
              clipp::match::integers(), "layer_sizes", params.layer_sizes))
             .doc("Sizes of the network layers, including the input and "
                  "output sizes (default: 784 30 10)"),
         (clipp::option("-e", "--epochs") &
          clipp::value(clipp::match::integers(), "epochs", params.num_epochs))
             .doc("Number of training epochs (default: " +
                  std::to_string(params.num_epochs) + ")"),
         (clipp::option("-b", "--batch-size") &
          clipp::value(
              clipp::match::integers(), "batch_size", params.batch_size))
             .doc("Mini-batch size (default: " +
                  std::to_string(params.batch_size) + ")"),
         (clipp::option("-l", "--learning-rate") &
          clipp::value(
              clipp::match::numbers(), "learning_rate", params.learning_rate))
             .doc("Learning rate (default: " +
                  std::to_string(params.learning_rate) + ")"),
         seed_option(),
         models_option(),
         output_option());

    const auto list_cli =
        (clipp::command("list").set(params.mode, Mode::list), models_option());

    const auto delete_cli =
        (clipp::command("delete").set(params.mode, Mode::remove),
         (clipp::option("--all")
              .set(params.delete_all)
              .doc("Delete every network") |
          clipp::value(
              clipp::match::prefix_not("-"), "id", params.network_id)),
         models_option());

    const auto inspect_cli =
        (clipp::command("inspect").set(params.mode, Mode::inspect),
         clipp::value(clipp::match::prefix_not("-"), "id", params.network_id),
         data_option(),
         seed_option(),
         models_option(),
         output_option());

    const auto cli =
        ((clipp::option("-h", "--help")
              .set(show_help)
              .doc("Show this message and exit") |
          train_cli | list_cli | delete_cli | inspect_cli),
         clipp::any_other(unmatched));

    assert(cli.common_flag_prefix() == "-");

    const auto result = clipp::parse(argc, argv, cli);

    const auto executable_name =
        std::filesystem::path(argv[0]).filename().string();

    if (show_help)
    {
        std::cout << clipp::make_man_page(cli, executable_name) << '\n';
        std::exit(EXIT_SUCCESS);
    }

    if (result.any_error() || !unmatched.empty() || params.mode == Mode::none)
    {
        print_error(result, unmatched, cli, executable_name);
        std::exit(EXIT_FAILURE);
    }

    if (params.layer_sizes.empty())
    {
        params.layer_sizes = {
            mnist_image_width * mnist_image_height, 30, mnist_num_classes};
    }
    if (params.layer_sizes.size() < 2)
    {
        std::cerr << "Error on network layout: at least an input and an "
                     "output size are required\n";
        std::exit(EXIT_FAILURE);
    }
    for (const auto size : params.layer_sizes)
    {
        if (size <= 0)
        {
            std::cerr << "Error on layer size of " << size
                      << ": must be strictly positive\n";
            std::exit(EXIT_FAILURE);
        }
    }
    if (params.layer_sizes.front() != mnist_image_width * mnist_image_height)
    {
        std::cerr << "Error on network input size of "
                  << params.layer_sizes.front() << ": must be "
                  << mnist_image_width * mnist_image_height << '\n';
        std::exit(EXIT_FAILURE);
    }
    if (params.layer_sizes.back() != mnist_num_classes)
    {
        std::cerr << "Error on network output size of "
                  << params.layer_sizes.back() << ": must be "
                  << mnist_num_classes << '\n';
        std::exit(EXIT_FAILURE);
    }
    if (params.num_epochs <= 0)
    {
        std::cerr << "Error on number of epochs of " << params.num_epochs
                  << ": must be strictly positive\n";
        std::exit(EXIT_FAILURE);
    }
    if (params.batch_size <= 0)
    {
        std::cerr << "Error on mini-batch size of " << params.batch_size
                  << ": must be strictly positive\n";
        std::exit(EXIT_FAILURE);
    }
    if (!(params.learning_rate > 0.0f))
    {
        std::cerr << "Error on learning rate of " << params.learning_rate
                  << ": must be strictly positive\n";
        std::exit(EXIT_FAILURE);
    }

    if (!params.has_seed)
    {
        params.seed = std::random_device {}();
    }

    return params;
}

void print_architecture(const std::vector<int> &sizes)
{
    for (const auto size : sizes)
    {
        std::cout << ' ' << size;
    }
}

void print_accuracy(std::optional<double> accuracy)
{
    if (accuracy)
    {
        std::cout << std::fixed << std::setprecision(2) << 100.0 * *accuracy
                  << '%' << std::defaultfloat << std::setprecision(6);
    }
    else
    {
        std::cout << '-';
    }
}

void print_prediction(const char *title, const ExamplePrediction &prediction)
{
    std::cout << title << ": example " << prediction.index << ", predicted "
              << prediction.predicted << ", actual " << prediction.actual
              << "\n  output:";
    for (const auto value : prediction.output)
    {
        std::cout << ' ' << std::fixed << std::setprecision(3) << value;
    }
    std::cout << std::defaultfloat << std::setprecision(6) << '\n';
}

[[nodiscard]] std::filesystem::path
prepare_output_directory(const std::string &directory)
{
    const std::filesystem::path path(directory);
    std::filesystem::create_directories(path);
    std::cout << "Output directory is ready: " << std::quoted(directory)
              << '\n';
    return path;
}

void write_network_images(const Network &network,
                          const std::filesystem::path &directory)
{
    for (std::size_t l {0}; l < network.weights().size(); ++l)
    {
        const auto file_name =
            directory / ("weights_" + std::to_string(l) + ".png");
        write_weights_image(file_name, network.weights()[l]);
        std::cout << "Saved weights of layer " << l + 1 << " to "
                  << file_name << '\n';
    }
}

void write_example_image(const std::filesystem::path &file_name,
                         const EvaluationExample &example)
{
    write_digit_image(
        file_name, example.input, mnist_image_width, mnist_image_height, 8);
    std::cout << "Saved digit to " << file_name << '\n';
}

int run_train(const Parameters &params)
{
    std::cout << "Data: " << std::quoted(params.data_directory) << '\n'
              << "Models: " << std::quoted(params.models_directory) << '\n'
              << "Network layout:";
    print_architecture(params.layer_sizes);
    std::cout << '\n'
              << "Epochs: " << params.num_epochs << '\n'
              << "Mini-batch size: " << params.batch_size << '\n'
              << "Learning rate: " << params.learning_rate << '\n'
              << "Seed: " << params.seed << '\n'
              << std::string(72, '-') << '\n';

    std::cout << "Loading MNIST data..." << std::endl;
    auto dataset = load_mnist(params.data_directory);
    std::cout << "Loaded " << dataset.training.size() << " training, "
              << dataset.validation.size() << " validation and "
              << dataset.test.size() << " test examples\n";
    const auto training_data =
        std::make_shared<const std::vector<TrainingExample>>(
            std::move(dataset.training));
    const auto test_data =
        std::make_shared<const std::vector<EvaluationExample>>(
            std::move(dataset.test));

    ModelRepository repository(params.models_directory);
    ConsoleObserver observer;
    SessionStore store(repository, observer);

    const auto network_id =
        store.create_network(params.layer_sizes, params.seed);
    std::cout << "Created network " << network_id << std::endl;

    const auto job_id = store.start_training(
        network_id,
        {.num_epochs = params.num_epochs,
         .batch_size = params.batch_size,
         .learning_rate = params.learning_rate,
         .seed = params.seed},
        training_data,
        test_data);
    const auto job = store.wait(job_id);
    if (job.status != JobStatus::completed)
    {
        return EXIT_FAILURE;
    }
    std::cout << "Saved network " << network_id << " to "
              << std::quoted(params.models_directory) << '\n';

    if (!params.output_directory.empty())
    {
        const auto directory =
            prepare_output_directory(params.output_directory);
        const auto network = store.network(network_id);
        write_network_images(*network, directory);

        const auto misclassified =
            find_misclassified_examples(*network, *test_data);
        if (misclassified.empty())
        {
            std::cout << "No misclassified examples found in the first 200 "
                         "test cases!\n";
        }
        for (const auto index : misclassified)
        {
            const auto &example = (*test_data)[index];
            std::cout << "Example " << index << " misclassified as "
                      << predict(*network, example.input) << " (actual "
                      << example.label << ")\n";
            write_example_image(
                directory / ("misclassified_" + std::to_string(index) + ".png"),
                example);
        }
    }

    return EXIT_SUCCESS;
}

int run_list(const Parameters &params)
{
    const ModelRepository repository(params.models_directory);
    const auto ids = repository.ids();
    if (ids.empty())
    {
        std::cout << "No saved networks in "
                  << std::quoted(params.models_directory) << '\n';
        return EXIT_SUCCESS;
    }
    const auto networks = repository.list();
    for (const auto &metadata : networks)
    {
        std::cout << metadata.network_id << "  layout:";
        print_architecture(metadata.architecture);
        std::cout << "  trained: " << (metadata.trained ? "yes" : "no")
                  << "  accuracy: ";
        print_accuracy(metadata.accuracy);
        std::cout << '\n';
    }
    for (const auto &network_id : ids)
    {
        const auto readable = std::any_of(
            networks.begin(),
            networks.end(),
            [&](const ModelMetadata &metadata)
            { return metadata.network_id == network_id; });
        if (!readable)
        {
            std::cerr << "Warning: cannot read saved network " << network_id
                      << '\n';
        }
    }
    return EXIT_SUCCESS;
}

int run_delete(const Parameters &params)
{
    ModelRepository repository(params.models_directory);
    ConsoleObserver observer;
    SessionStore store(repository, observer);

    if (params.delete_all)
    {
        const auto result = store.remove_all_networks();
        std::cout << "Successfully deleted " << result.deleted_count
                  << " network(s)\n";
        return EXIT_SUCCESS;
    }

    if (!repository.contains(params.network_id))
    {
        std::cerr << "Network " << params.network_id << " not found\n";
        return EXIT_FAILURE;
    }
    static_cast<void>(store.remove_network(params.network_id));
    std::cout << "Deleted network " << params.network_id << '\n';
    return EXIT_SUCCESS;
}

int run_inspect(const Parameters &params)
{
    ModelRepository repository(params.models_directory);
    ConsoleObserver observer;
    SessionStore store(repository, observer);

    if (!store.load_network(params.network_id))
    {
        std::cerr << "Network " << params.network_id << " not found in "
                  << std::quoted(params.models_directory) << '\n';
        return EXIT_FAILURE;
    }
    const auto summary = store.network_summary(params.network_id);
    const auto network = store.network(params.network_id);

    std::cout << "Network " << summary.network_id << '\n' << "Layout:";
    print_architecture(summary.architecture);
    std::cout << "\nTrained: " << (summary.trained ? "yes" : "no")
              << "\nSaved accuracy: ";
    print_accuracy(summary.accuracy);
    std::cout << '\n';

    const auto statistics = layer_statistics(*network);
    for (std::size_t l {0}; l < statistics.size(); ++l)
    {
        const auto &layer = statistics[l];
        std::cout << "Layer " << l + 1 << ": weights " << layer.rows << " x "
                  << layer.cols << " (mean " << layer.weights.mean
                  << ", std " << layer.weights.standard_deviation << ", min "
                  << layer.weights.min << ", max " << layer.weights.max
                  << "), biases (mean " << layer.biases.mean << ", std "
                  << layer.biases.standard_deviation << ")\n";
    }

    std::cout << "Loading MNIST data..." << std::endl;
    const auto dataset = load_mnist(params.data_directory);
    const auto correct = evaluate(*network, dataset.test);
    std::cout << "Test set: " << correct << " / " << dataset.test.size()
              << '\n';

    std::minstd_rand rng(params.seed);
    const auto successful =
        find_example(*network, dataset.test, true, 100, rng);
    const auto unsuccessful =
        find_example(*network, dataset.test, false, 200, rng);
    if (successful)
    {
        print_prediction("Successful", *successful);
    }
    else
    {
        std::cout << "No successful example found after 100 attempts\n";
    }
    if (unsuccessful)
    {
        print_prediction("Unsuccessful", *unsuccessful);
    }
    else
    {
        std::cout << "No unsuccessful example found after 200 attempts\n";
    }

    if (!params.output_directory.empty())
    {
        const auto directory =
            prepare_output_directory(params.output_directory);
        write_network_images(*network, directory);
        if (successful)
        {
            write_example_image(directory / "successful_example.png",
                                dataset.test[successful->index]);
        }
        if (unsuccessful)
        {
            write_example_image(directory / "unsuccessful_example.png",
                                dataset.test[unsuccessful->index]);
        }
    }

    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto params = parse_command_line(argc, argv);

        switch (params.mode)
        {
        case Mode::train: return run_train(params);
        case Mode::list: return run_list(params);
        case Mode::remove: return run_delete(params);
        case Mode::inspect: return run_inspect(params);
        case Mode::none: break;
        }
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "Unknown exception thrown\n";
        return EXIT_FAILURE;
    }
}
