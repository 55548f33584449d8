/**
 * @file submit_main.cpp
 * @brief testrelay-submit: sends one bundle to a dispatcher and prints the response.
 *
 *     testrelay-submit <bundle-file> [control-endpoint] [deadline-ms]
 *     testrelay-submit --health [control-endpoint]
 *
 * Prints the SUBMIT_ACK as JSON on stdout. Exit status is 0 for a completed job,
 * 2 for any failed outcome and 1 for usage or transport errors.
 */
#include "trl_service.hpp"

#include "dispatch/relay_client.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace
{
constexpr const char *kDefaultEndpoint = "tcp://127.0.0.1:8325";
constexpr std::chrono::milliseconds kHealthTimeout{3000};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " <bundle-file> [control-endpoint] [deadline-ms]\n"
              << "  " << prog << " --health [control-endpoint]\n\n"
              << "Default endpoint: " << kDefaultEndpoint << "\n";
}

std::vector<uint8_t> read_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("cannot open '" + path + "'");
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
} // namespace

int main(int argc, char *argv[])
{
    using namespace testrelay;

    if (argc < 2 || std::string_view(argv[1]) == "--help" || std::string_view(argv[1]) == "-h")
    {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }
    // Only warnings and errors from the library; stdout carries the response.
    utils::Logger::instance().set_level(utils::Logger::Level::L_WARNING);

    const std::string endpoint = argc >= 3 ? argv[2] : kDefaultEndpoint;
    int rc = 0;

    if (std::string_view(argv[1]) == "--health")
    {
        dispatch::RelayClient client(endpoint);
        if (auto health = client.health(kHealthTimeout))
        {
            std::cout << health->dump(2) << "\n";
        }
        else
        {
            std::cerr << "No HEALTH_ACK from " << endpoint << "\n";
            rc = 1;
        }
    }
    else
    {
        try
        {
            std::chrono::milliseconds deadline{0};
            if (argc >= 4)
            {
                deadline = std::chrono::milliseconds(std::stoull(argv[3]));
            }
            const std::vector<uint8_t> bundle = read_file(argv[1]);

            dispatch::RelayClient client(endpoint);
            const dispatch::SubmitReply reply = client.submit(bundle, deadline);

            nlohmann::json out{{"job_id", reply.job_id},
                               {"status", std::string(reply.outcome.submit_status())},
                               {"outcome", reply.outcome.to_json()}};
            std::cout << out.dump(2) << "\n";
            rc = reply.outcome.is_success() ? 0 : 2;
        }
        catch (const std::exception &e)
        {
            std::cerr << "testrelay-submit: " << e.what() << "\n";
            rc = 1;
        }
    }

    utils::zmq_context_shutdown();
    utils::Logger::instance().shutdown();
    return rc;
}
