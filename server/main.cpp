#include <csignal>
#include <iostream>
#include <string>

#include "target_server.hpp"

int main(int argc, char* argv[])
{
    if (argc < 3 || argc > 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <port> <threads> [rate_limit_per_sec] [delay_ms]\n"
                  << "Example: " << argv[0] << " 3000 16 200 50\n";
        return 1;
    }

    int port = 0;
    int num_threads = 0;
    int rate_limit = 0;
    int delay_ms = 0;
    try {
        port = std::stoi(argv[1]);
        num_threads = std::stoi(argv[2]);
        if (argc >= 4) rate_limit = std::stoi(argv[3]);
        if (argc >= 5) delay_ms = std::stoi(argv[4]);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }
    if (port <= 0 || num_threads <= 0 || rate_limit < 0 || delay_ms < 0) {
        std::cerr << "Port and threads must be positive, rate limit and delay non-negative.\n";
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    TargetServer svr(num_threads, rate_limit, delay_ms);
    std::cout << "Rate limit: " << (rate_limit > 0 ? std::to_string(rate_limit) + " req/s" : "none")
              << ", delay: " << delay_ms << " ms" << std::endl;

    return svr.Listen(port) == 0 ? 0 : 1;
}
