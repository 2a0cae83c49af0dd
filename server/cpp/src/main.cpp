// DataSwap engine front end
//
// Serves the JSON request API either line by line on stdin/stdout or over a
// WebSocket listener. One request object per line or per text frame.

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dataswap/api.hpp"
#include "dataswap/config.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/exchange.hpp"
#include "dataswap/logging.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using WsServer = websocketpp::server<websocketpp::config::asio>;
using ConnectionHdl = websocketpp::connection_hdl;
using MessagePtr = WsServer::message_ptr;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    uint16_t listen_port = 0;  // 0: stdin mode
    size_t threads = 1;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cout << "DataSwap AMM engine\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>   TOML configuration file\n"
              << "  -l, --listen <port>   Serve requests over WebSocket on <port>\n"
              << "  -t, --threads <n>     WebSocket I/O threads (default: 1)\n"
              << "  -v, --verbose         Debug logging\n"
              << "  -h, --help            Show this help message\n\n"
              << "Without --listen, requests are read from stdin, one JSON object per line:\n"
              << "  {\"id\":1,\"op\":\"addLiquidity\",\"params\":{\"tokenA\":\"DATA\",\"tokenB\":\"USDC\","
                 "\"amountA\":\"1000\",\"amountB\":\"4000\",\"provider\":\"alice\"}}\n"
              << "  {\"id\":2,\"op\":\"quote\",\"params\":{\"tokenIn\":\"DATA\",\"tokenOut\":\"USDC\","
                 "\"amountIn\":\"100\"}}\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing " << what << " argument\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            options.config_path = next("config");
        } else if (arg == "-l" || arg == "--listen") {
            int port = std::atoi(next("port").c_str());
            if (port <= 0 || port > 65535) {
                std::cerr << "Invalid port\n";
                std::exit(1);
            }
            options.listen_port = static_cast<uint16_t>(port);
        } else if (arg == "-t" || arg == "--threads") {
            int n = std::atoi(next("threads").c_str());
            if (n <= 0) {
                std::cerr << "Invalid thread count\n";
                std::exit(1);
            }
            options.threads = static_cast<size_t>(n);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }
    return options;
}

//------------------------------------------------------------------------------
// Serving
//------------------------------------------------------------------------------

void run_stdin(dataswap::RequestHandler& handler) {
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::cout << handler.handle_line(line) << std::endl;
    }
}

void run_websocket(dataswap::RequestHandler& handler, uint16_t port, size_t threads) {
    WsServer ws;
    ws.clear_access_channels(websocketpp::log::alevel::all);
    ws.clear_error_channels(websocketpp::log::elevel::all);
    ws.init_asio();
    ws.set_reuse_addr(true);

    ws.set_open_handler([](ConnectionHdl) {
        spdlog::debug("client connected");
    });

    ws.set_message_handler([&ws, &handler](ConnectionHdl hdl, MessagePtr msg) {
        std::string reply = handler.handle_line(msg->get_payload());
        websocketpp::lib::error_code ec;
        ws.send(hdl, reply, websocketpp::frame::opcode::text, ec);
        if (ec) {
            spdlog::warn("send failed: {}", ec.message());
        }
    });

    ws.listen(port);
    ws.start_accept();
    spdlog::info("listening on ws://0.0.0.0:{} with {} threads", port, threads);

    std::vector<std::thread> pool;
    for (size_t i = 1; i < threads; ++i) {
        pool.emplace_back([&ws]() { ws.run(); });
    }
    ws.run();
    for (auto& t : pool) {
        t.join();
    }
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        dataswap::Config config = options.config_path.empty()
            ? dataswap::Config{}
            : dataswap::Config::from_file(options.config_path);
        if (options.verbose) {
            config.with_log_level("debug");
        }
        config.validate();
        dataswap::setup_logging(config.log);

        dataswap::Exchange exchange(config);
        dataswap::RequestHandler handler(exchange);

        if (options.listen_port != 0) {
            run_websocket(handler, options.listen_port, options.threads);
        } else {
            run_stdin(handler);
        }
    } catch (const dataswap::Error& e) {
        std::cerr << "fatal: " << dataswap::to_string(e.code()) << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
