#include "session_store.hpp"

#include <cstdio>
#include <exception>
#include <set>
#include <stdexcept>
#include <utility>

const char *to_string(JobStatus status) noexcept
{
    switch (status)
    {
    case JobStatus::pending: return "pending";
    case JobStatus::training: return "training";
    case JobStatus::completed: return "completed";
    case JobStatus::failed: return "failed";
    }
    return "unknown";
}

SessionStore::SessionStore(ModelRepository &repository,
                           TrainingObserver &observer,
                           std::size_t max_finished_jobs)
    : m_repository(repository),
      m_observer(observer),
      m_max_finished_jobs(max_finished_jobs),
      m_id_rng(std::random_device {}())
{
}

SessionStore::~SessionStore()
{
    for (auto &[job_id, worker] : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

void SessionStore::join_finished_workers()
{
    for (auto it = m_workers.begin(); it != m_workers.end();)
    {
        // finish_job() is the last time a worker takes the mutex, so a
        // finished worker can be joined while holding it
        const auto job = m_jobs.find(it->first);
        const auto finished = job == m_jobs.end() ||
                              job->second.status == JobStatus::completed ||
                              job->second.status == JobStatus::failed;
        if (!finished)
        {
            ++it;
            continue;
        }
        if (it->second.joinable())
        {
            it->second.join();
        }
        it = m_workers.erase(it);
    }
}

std::string SessionStore::generate_id()
{
    char buffer[33];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%016llx%016llx",
                  static_cast<unsigned long long>(m_id_rng()),
                  static_cast<unsigned long long>(m_id_rng()));
    return buffer;
}

SessionStore::Entry &SessionStore::entry(const std::string &network_id)
{
    const auto it = m_networks.find(network_id);
    if (it == m_networks.end())
    {
        throw std::out_of_range("Network " + network_id + " not found");
    }
    return it->second;
}

const SessionStore::Entry &
SessionStore::entry(const std::string &network_id) const
{
    const auto it = m_networks.find(network_id);
    if (it == m_networks.end())
    {
        throw std::out_of_range("Network " + network_id + " not found");
    }
    return it->second;
}

std::string SessionStore::create_network(const std::vector<int> &sizes,
                                         unsigned int seed)
{
    std::minstd_rand rng(seed);
    auto network = std::make_shared<Network>(sizes, rng);

    const std::lock_guard lock(m_mutex);
    auto network_id = generate_id();
    m_networks.emplace(network_id,
                       Entry {.network = std::move(network),
                              .trained = false,
                              .accuracy = {},
                              .active_job = {}});
    return network_id;
}

bool SessionStore::load_network(const std::string &network_id)
{
    {
        const std::lock_guard lock(m_mutex);
        if (m_networks.contains(network_id))
        {
            return true;
        }
    }

    auto stored = m_repository.load(network_id);
    if (!stored)
    {
        return false;
    }

    const std::lock_guard lock(m_mutex);
    m_networks.emplace(
        network_id,
        Entry {.network =
                   std::make_shared<Network>(std::move(stored->network)),
               .trained = stored->metadata.trained,
               .accuracy = stored->metadata.accuracy,
               .active_job = {}});
    return true;
}

std::shared_ptr<const Network>
SessionStore::network(const std::string &network_id) const
{
    const std::lock_guard lock(m_mutex);
    const auto &found = entry(network_id);
    if (found.active_job)
    {
        throw std::logic_error("Network " + network_id +
                               " is being trained by job " +
                               *found.active_job);
    }
    return found.network;
}

NetworkSummary
SessionStore::network_summary(const std::string &network_id) const
{
    const std::lock_guard lock(m_mutex);
    const auto &found = entry(network_id);
    return {.network_id = network_id,
            .architecture = found.network->sizes(),
            .trained = found.trained,
            .accuracy = found.accuracy,
            .in_memory = true};
}

std::vector<NetworkSummary> SessionStore::list_networks() const
{
    std::vector<NetworkSummary> result;
    {
        const std::lock_guard lock(m_mutex);
        for (const auto &[network_id, found] : m_networks)
        {
            result.push_back({.network_id = network_id,
                              .architecture = found.network->sizes(),
                              .trained = found.trained,
                              .accuracy = found.accuracy,
                              .in_memory = true});
        }
    }

    for (auto &metadata : m_repository.list())
    {
        const std::lock_guard lock(m_mutex);
        if (m_networks.contains(metadata.network_id))
        {
            continue;
        }
        result.push_back({.network_id = std::move(metadata.network_id),
                          .architecture = std::move(metadata.architecture),
                          .trained = metadata.trained,
                          .accuracy = metadata.accuracy,
                          .in_memory = false});
    }
    return result;
}

RemovalResult SessionStore::remove_network(const std::string &network_id)
{
    bool deleted_from_memory {false};
    {
        const std::lock_guard lock(m_mutex);
        const auto it = m_networks.find(network_id);
        if (it != m_networks.end())
        {
            if (it->second.active_job)
            {
                throw std::logic_error("Cannot delete network " + network_id +
                                       " while job " + *it->second.active_job +
                                       " is running");
            }
            m_networks.erase(it);
            deleted_from_memory = true;
        }
    }

    const auto deleted_from_disk = m_repository.remove(network_id);
    if (!deleted_from_memory && !deleted_from_disk)
    {
        throw std::out_of_range("Network " + network_id + " not found");
    }
    return {.deleted_from_memory = deleted_from_memory,
            .deleted_from_disk = deleted_from_disk};
}

RemoveAllResult SessionStore::remove_all_networks()
{
    std::set<std::string> network_ids;
    {
        const std::lock_guard lock(m_mutex);
        for (const auto &[network_id, found] : m_networks)
        {
            if (found.active_job)
            {
                throw std::logic_error("Cannot delete network " + network_id +
                                       " while job " + *found.active_job +
                                       " is running");
            }
            network_ids.insert(network_id);
        }
    }
    // Files that cannot be read are deleted as well
    for (auto &network_id : m_repository.ids())
    {
        network_ids.insert(std::move(network_id));
    }

    RemoveAllResult result {
        .deleted_count = 0, .deleted_from_memory = 0, .deleted_from_disk = 0};
    for (const auto &network_id : network_ids)
    {
        const auto removal = remove_network(network_id);
        ++result.deleted_count;
        result.deleted_from_memory += removal.deleted_from_memory ? 1 : 0;
        result.deleted_from_disk += removal.deleted_from_disk ? 1 : 0;
    }
    return result;
}

std::string SessionStore::start_training(
    const std::string &network_id,
    const TrainingRequest &request,
    std::shared_ptr<const std::vector<TrainingExample>> training_data,
    std::shared_ptr<const std::vector<EvaluationExample>> test_data)
{
    if (!training_data)
    {
        throw std::invalid_argument("Missing training data");
    }

    const std::lock_guard lock(m_mutex);
    auto &found = entry(network_id);
    if (found.active_job)
    {
        throw std::logic_error("Network " + network_id +
                               " is already being trained by job " +
                               *found.active_job);
    }

    join_finished_workers();

    auto working = std::make_shared<Network>(*found.network);
    auto job_id = generate_id();
    m_jobs.emplace(job_id,
                   TrainingJob {.job_id = job_id,
                                .network_id = network_id,
                                .status = JobStatus::pending,
                                .progress = 0.0,
                                .num_epochs = request.num_epochs,
                                .accuracy = {},
                                .error = {}});
    found.active_job = job_id;

    m_workers.emplace(job_id,
                      std::thread(&SessionStore::run_job,
                                  this,
                                  job_id,
                                  network_id,
                                  std::move(working),
                                  request,
                                  std::move(training_data),
                                  std::move(test_data)));
    return job_id;
}

void SessionStore::run_job(
    const std::string &job_id,
    const std::string &network_id,
    std::shared_ptr<Network> network,
    TrainingRequest request,
    std::shared_ptr<const std::vector<TrainingExample>> training_data,
    std::shared_ptr<const std::vector<EvaluationExample>> test_data)
{
    std::optional<double> accuracy;
    try
    {
        std::minstd_rand rng(request.seed);

        const auto on_epoch = [&](const EpochReport &report)
        {
            const auto progress = 100.0 * static_cast<double>(report.epoch) /
                                  static_cast<double>(report.total_epochs);
            {
                const std::lock_guard lock(m_mutex);
                auto &job = m_jobs.at(job_id);
                job.status = JobStatus::training;
                job.progress = progress;
            }
            m_observer.on_epoch({.job_id = job_id,
                                 .network_id = network_id,
                                 .report = report,
                                 .progress = progress});
        };

        sgd(*network,
            *training_data,
            request.num_epochs,
            request.batch_size,
            request.learning_rate,
            rng,
            test_data.get(),
            on_epoch);

        if (test_data && !test_data->empty())
        {
            accuracy = static_cast<double>(evaluate(*network, *test_data)) /
                       static_cast<double>(test_data->size());
        }

        {
            const std::lock_guard lock(m_mutex);
            auto &found = entry(network_id);
            found.network = network;
            found.trained = true;
            found.accuracy = accuracy;
        }
        m_repository.save(*network, network_id, true, accuracy);
    }
    catch (const std::exception &e)
    {
        m_observer.on_error(job_id, network_id, e.what());
        finish_job(job_id,
                   network_id,
                   std::move(network),
                   JobStatus::failed,
                   {},
                   e.what());
        return;
    }

    m_observer.on_complete(job_id, network_id, accuracy);
    finish_job(job_id,
               network_id,
               std::move(network),
               JobStatus::completed,
               accuracy,
               {});
}

void SessionStore::finish_job(const std::string &job_id,
                              const std::string &network_id,
                              std::shared_ptr<Network> network,
                              JobStatus status,
                              std::optional<double> accuracy,
                              const std::string &error)
{
    {
        const std::lock_guard lock(m_mutex);
        auto &job = m_jobs.at(job_id);
        job.status = status;
        job.accuracy = accuracy;
        job.error = error;
        if (status == JobStatus::completed)
        {
            job.progress = 100.0;
        }
        // A failed job keeps the updates it completed
        const auto it = m_networks.find(network_id);
        if (it != m_networks.end())
        {
            it->second.network = std::move(network);
            it->second.active_job.reset();
        }

        m_finished_jobs.push_back(job_id);
        while (m_finished_jobs.size() > m_max_finished_jobs)
        {
            m_jobs.erase(m_finished_jobs.front());
            m_finished_jobs.pop_front();
        }
    }
    m_job_finished.notify_all();
}

TrainingJob SessionStore::job(const std::string &job_id) const
{
    const std::lock_guard lock(m_mutex);
    const auto it = m_jobs.find(job_id);
    if (it == m_jobs.end())
    {
        throw std::out_of_range("Training job " + job_id + " not found");
    }
    return it->second;
}

TrainingJob SessionStore::wait(const std::string &job_id)
{
    std::unique_lock lock(m_mutex);
    if (!m_jobs.contains(job_id))
    {
        throw std::out_of_range("Training job " + job_id + " not found");
    }
    m_job_finished.wait(lock,
                        [&]
                        {
                            const auto it = m_jobs.find(job_id);
                            return it == m_jobs.end() ||
                                   it->second.status == JobStatus::completed ||
                                   it->second.status == JobStatus::failed;
                        });
    const auto it = m_jobs.find(job_id);
    if (it == m_jobs.end())
    {
        throw std::out_of_range("Training job " + job_id +
                                " is no longer retained");
    }
    return it->second;
}

StoreStatus SessionStore::status() const
{
    const std::lock_guard lock(m_mutex);
    return {.num_networks = m_networks.size(),
            .num_jobs = m_jobs.size(),
            .num_workers = m_workers.size()};
}
