// Copyright (c) 2025 VAM Desktop Live Whisper
// Streaming transcription server: WebSocket in, JSON transcripts out

#include "asr/engine_provider.hpp"
#include "asr/whisper_engine.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "net/inference_runner.hpp"
#include "net/listener.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    core::ServerConfig config;
    std::string error;
    switch (core::parse_args(argc, argv, config, error)) {
    case core::ParseResult::Help:
        std::cout << core::usage(argv[0]);
        return 0;
    case core::ParseResult::Error:
        std::cerr << error << "\n\n" << core::usage(argv[0]);
        return 2;
    case core::ParseResult::Ok:
        break;
    }
    if (config.verbose) core::set_log_level(core::LogLevel::Debug);
    core::log_info("[init] live_transcribe_server: " + core::describe(config));

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(config.host, ec);
    if (ec) {
        core::log_error("[init] invalid --host " + config.host + ": " + ec.message());
        return 2;
    }

    asr::WhisperOptions wopts;
    wopts.model = config.model;
    wopts.use_gpu = config.use_gpu;
    wopts.threads = config.threads;
    wopts.states = config.inference_workers;
    wopts.verbose = config.verbose;

    auto context = std::make_shared<net::ServerContext>();
    context->config = config;
    context->engines = std::make_shared<asr::EngineProvider>([wopts] {
        return std::make_shared<asr::WhisperEngine>(wopts);
    });
    context->runner = std::make_shared<net::InferenceRunner>(static_cast<size_t>(config.inference_workers));

    // Warm the model in the background; early connections wait on the same load.
    if (config.preload) context->engines->preload();

    boost::asio::io_context ioc(config.io_threads);
    auto listener = std::make_shared<net::Listener>(ioc, net::tcp::endpoint(address, config.port), context);
    if (!listener->ok()) return 1;
    listener->run();

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int sig) {
        core::log_info("[init] signal " + std::to_string(sig) + ", shutting down");
        listener->stop();
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.io_threads - 1));
    for (int i = 1; i < config.io_threads; ++i) {
        threads.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : threads) t.join();

    context->runner->stop();
    core::log_info("[init] stopped");
    return 0;
}
