#ifndef SESSION_STORE_HPP
#define SESSION_STORE_HPP

#include "model_repository.hpp"
#include "network.hpp"
#include "training.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

struct TrainingRequest
{
    int num_epochs {5};
    int batch_size {10};
    float learning_rate {3.0f};
    unsigned int seed {0};
};

enum class JobStatus
{
    pending,
    training,
    completed,
    failed
};

[[nodiscard]] const char *to_string(JobStatus status) noexcept;

struct TrainingJob
{
    std::string job_id;
    std::string network_id;
    JobStatus status;
    double progress; // percent
    int num_epochs;
    std::optional<double> accuracy;
    std::string error;
};

struct TrainingUpdate
{
    std::string job_id;
    std::string network_id;
    EpochReport report;
    double progress;
};

// Notified from the worker thread of a training job. Implementations must not
// throw from on_complete() and on_error(). An exception thrown from
// on_epoch() stops the job, which is then reported as failed.
class TrainingObserver
{
public:
    virtual ~TrainingObserver() = default;

    virtual void on_epoch(const TrainingUpdate &update) = 0;

    virtual void on_complete(const std::string &job_id,
                             const std::string &network_id,
                             std::optional<double> accuracy) = 0;

    virtual void on_error(const std::string &job_id,
                          const std::string &network_id,
                          const std::string &message) = 0;
};

struct NetworkSummary
{
    std::string network_id;
    std::vector<int> architecture;
    bool trained;
    std::optional<double> accuracy;
    bool in_memory;
};

struct StoreStatus
{
    std::size_t num_networks;
    std::size_t num_jobs;
    std::size_t num_workers;
};

struct RemovalResult
{
    bool deleted_from_memory;
    bool deleted_from_disk;
};

struct RemoveAllResult
{
    int deleted_count;
    int deleted_from_memory;
    int deleted_from_disk;
};

// Networks held in memory and the training jobs running on them. Every
// network has at most one job in flight, and cannot be read or removed while
// that job is running. A job trains a copy of the network, which replaces the
// stored one when the job ends, so pointers returned by network() always refer
// to parameters that no longer change. Unknown ids throw std::out_of_range.
class SessionStore
{
public:
    // Only the most recent max_finished_jobs completed or failed jobs are kept
    SessionStore(ModelRepository &repository,
                 TrainingObserver &observer,
                 std::size_t max_finished_jobs = 100);
    ~SessionStore();

    SessionStore(const SessionStore &) = delete;
    SessionStore &operator=(const SessionStore &) = delete;

    [[nodiscard]] std::string create_network(const std::vector<int> &sizes,
                                             unsigned int seed);

    // Brings a saved network into memory. Returns false if there is no such
    // network on disk.
    bool load_network(const std::string &network_id);

    [[nodiscard]] std::shared_ptr<const Network>
    network(const std::string &network_id) const;

    [[nodiscard]] NetworkSummary
    network_summary(const std::string &network_id) const;

    // Networks in memory, then saved networks not in memory
    [[nodiscard]] std::vector<NetworkSummary> list_networks() const;

    RemovalResult remove_network(const std::string &network_id);

    RemoveAllResult remove_all_networks();

    // test_data may be null, in which case no accuracy is measured
    [[nodiscard]] std::string
    start_training(const std::string &network_id,
                   const TrainingRequest &request,
                   std::shared_ptr<const std::vector<TrainingExample>>
                       training_data,
                   std::shared_ptr<const std::vector<EvaluationExample>>
                       test_data);

    [[nodiscard]] TrainingJob job(const std::string &job_id) const;

    // Blocks until the job is completed or failed, and the observer has been
    // notified of it. Throws std::out_of_range if the job record was dropped
    // in the meantime.
    TrainingJob wait(const std::string &job_id);

    [[nodiscard]] StoreStatus status() const;

private:
    struct Entry
    {
        std::shared_ptr<Network> network;
        bool trained;
        std::optional<double> accuracy;
        std::optional<std::string> active_job;
    };

    void run_job(const std::string &job_id,
                 const std::string &network_id,
                 std::shared_ptr<Network> network,
                 TrainingRequest request,
                 std::shared_ptr<const std::vector<TrainingExample>>
                     training_data,
                 std::shared_ptr<const std::vector<EvaluationExample>>
                     test_data);

    void finish_job(const std::string &job_id,
                    const std::string &network_id,
                    std::shared_ptr<Network> network,
                    JobStatus status,
                    std::optional<double> accuracy,
                    const std::string &error);

    // Requires m_mutex
    void join_finished_workers();

    [[nodiscard]] std::string generate_id();

    [[nodiscard]] Entry &entry(const std::string &network_id);
    [[nodiscard]] const Entry &entry(const std::string &network_id) const;

    ModelRepository &m_repository;
    TrainingObserver &m_observer;
    std::size_t m_max_finished_jobs;

    mutable std::mutex m_mutex;
    std::condition_variable m_job_finished;
    std::map<std::string, Entry> m_networks;
    std::map<std::string, TrainingJob> m_jobs;
    std::deque<std::string> m_finished_jobs;
    std::map<std::string, std::thread> m_workers; // by job id
    std::mt19937_64 m_id_rng;
};

#endif // SESSION_STORE_HPP
