// Copyright 2025 PlugPoll Contributors
// SPDX-License-Identifier: Apache-2.0
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

/// @file plugpoll/main.cpp
/// @brief Smart plug power collector main entry point
///
/// Polls Kasa and Tapo plugs and writes their power readings to every
/// configured destination, once or on a fixed interval.

#include "common/time_utils.hpp"
#include "plugpoll/auth_negotiator.hpp"
#include "plugpoll/collector.hpp"
#include "plugpoll/config.hpp"
#include "plugpoll/fanout_writer.hpp"
#include "plugpoll/logging.hpp"
#include "plugpoll/poll_cycle.hpp"
#include "plugpoll/scheduler.hpp"
#include "plugpoll/sinks/influx_sink.hpp"
#include "plugpoll/sinks/log_sink.hpp"
#include "plugpoll/vendors/kasa_client.hpp"
#include "plugpoll/vendors/tapo_client.hpp"

#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <map>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

std::string config_path(int argc, char* argv[]) {
    if (argc > 1) {
        return argv[1];
    }
    const char* env = std::getenv("CONF_FILE");
    if (env && *env) {
        return env;
    }
    return "config/plugpoll.yaml";
}

/// One sink per distinct server; destinations that differ only in
/// bucket/org share it.
std::vector<plugpoll::SinkTarget> build_targets(const plugpoll::Config& config,
                                                std::chrono::seconds timeout) {
    std::map<std::string, std::shared_ptr<plugpoll::MetricSink>> sinks;
    std::vector<plugpoll::SinkTarget> targets;

    for (const auto& dest : config.destinations) {
        std::string key = dest.type + "|" + dest.url + "|" + dest.token;
        auto& sink = sinks[key];
        if (!sink) {
            if (dest.type == "log") {
                sink = std::make_shared<plugpoll::sinks::LogSink>();
            } else {
                plugpoll::sinks::InfluxConfig influx;
                influx.url = dest.url;
                influx.token = dest.token;
                influx.timeout = timeout;
                sink = std::make_shared<plugpoll::sinks::InfluxSink>(influx);
            }
            if (!sink->start()) {
                throw plugpoll::ConfigError("destination " + dest.name + " could not be started");
            }
        }
        targets.push_back(plugpoll::SinkTarget{dest.name, dest.bucket, dest.org, sink});
    }
    return targets;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::SetStderrLogging(google::INFO);
    FLAGS_colorlogtostderr = true;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string path = config_path(argc, argv);
    LOG(INFO) << "plugpoll starting with " << path;

    std::vector<plugpoll::SinkTarget> targets;
    try {
        plugpoll::Config config = plugpoll::load_config(path);
        plugpoll::apply_log_level(config.poller.loglevel);

        std::chrono::seconds timeout(config.poller.timeout_sec);
        plugpoll::Scheduler scheduler(config.poller.persist, config.poller.interval_sec);

        plugpoll::vendors::KasaClient kasa_client(timeout);
        plugpoll::vendors::TapoKlapClient tapo_klap(timeout);
        plugpoll::vendors::TapoPassthroughClient tapo_passthrough(timeout);
        plugpoll::AuthNegotiator negotiator(tapo_klap, tapo_passthrough);

        plugpoll::PollCycle cycle(config.kasa, config.tapo, kasa_client, negotiator,
                                  config.poller.workers);

        targets = build_targets(config, timeout);
        if (targets.empty()) {
            LOG(WARNING) << "No destinations configured; readings will only be logged";
        }
        plugpoll::FanoutWriter writer(targets, config.poller.workers > 1);
        plugpoll::Collector collector(cycle, writer, &utils::now_ns);

        // Signal handlers cannot take the scheduler's lock; hand the stop
        // request over from a regular thread.
        std::atomic<bool> finished{false};
        std::thread watcher([&scheduler, &finished] {
            while (g_running && !finished) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (!g_running) {
                LOG(INFO) << "Received signal, shutting down...";
                scheduler.stop();
            }
        });

        LOG(INFO) << "Collecting from " << cycle.device_count() << " devices into "
                  << targets.size() << " destinations";

        std::exception_ptr failure;
        try {
            scheduler.run([&collector] { collector.run_once(); });
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        finished = true;
        watcher.join();
        if (failure) {
            std::rethrow_exception(failure);
        }

    } catch (const plugpoll::ConfigError& e) {
        LOG(ERROR) << "Configuration error: " << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }

    for (const auto& target : targets) {
        target.connection->stop();
    }

    LOG(INFO) << "plugpoll shutdown complete";
    google::ShutdownGoogleLogging();
    return 0;
}
