/* SPDX-License-Identifier: MPL-2.0 */

//  Publishes synthetic price ticks to subscribers, or subscribes and prints
//  them.
//
//    ticks_pubsub --publish [--bind tcp://*:5601] [--count N]
//    ticks_pubsub [--connect tcp://127.0.0.1:5601] [--topic ticks.EURUSD]

#include <qlink.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

static volatile sig_atomic_t g_running = 1;

static void signal_handler(int) { g_running = 0; }

namespace
{
const char *const symbols[] = {"EURUSD", "USDJPY", "GBPUSD"};

class printer_t : public qlink::i_event_handler
{
  public:
    void on_event(const qlink::event_t &event_)
    {
        switch (event_.event) {
            case QLINK_EVENT_CONNECTED:
                std::printf("connected to %s (%s)\n", event_.address.c_str(),
                            event_.identity.c_str());
                break;
            case QLINK_EVENT_DISCONNECTED:
                std::printf("disconnected: %s\n",
                            qlink_strerror(static_cast<int>(event_.value)));
                break;
            case QLINK_EVENT_RECONNECTING:
                std::printf("reconnecting, attempt %lld\n",
                            static_cast<long long>(event_.value));
                break;
            case QLINK_EVENT_UNREACHABLE:
                std::printf("publisher unreachable\n");
                g_running = 0;
                break;
            case QLINK_EVENT_MESSAGE_RECEIVED:
                std::printf("%s %s\n", event_.topic.c_str(),
                            event_.data.c_str());
                break;
            default:
                break;
        }
        std::fflush(stdout);
    }
};

int run_publisher(const std::string &endpoint_, int count_)
{
    qlink::context_t ctx;
    qlink::server_t server(ctx);
    server.set(QLINK_IDENTITY, std::string("ticks-publisher"));
    server.set(QLINK_BACKPRESSURE, QLINK_BACKPRESSURE_DROP_OLDEST);
    if (server.bind(endpoint_) != 0) {
        std::fprintf(stderr, "bind %s: %s\n", endpoint_.c_str(),
                     qlink_strerror(qlink_errno()));
        return 1;
    }
    std::printf("publishing on %s\n", server.last_endpoint().c_str());
    std::fflush(stdout);

    double price[3] = {1.0841, 151.32, 1.2650};
    for (int n = 0; g_running && (count_ <= 0 || n < count_); ++n) {
        const int i = n % 3;
        price[i] *= (n % 2) ? 1.0001 : 0.9999;
        char body[64];
        std::snprintf(body, sizeof body, "%.5f", price[i]);
        const std::string topic = std::string("ticks.") + symbols[i];
        server.publish(topic, body, std::strlen(body));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    server.close();
    return 0;
}

int run_subscriber(const std::string &endpoint_, const std::string &topic_)
{
    printer_t printer;
    qlink::context_t ctx;
    qlink::client_t client(ctx);
    client.on_event(&printer);
    client.set(QLINK_RECONNECT_MAX_ATTEMPTS, 0);

    qlink::subscription_id_t sub;
    if (topic_.empty()) {
        for (size_t i = 0; i < sizeof symbols / sizeof symbols[0]; ++i)
            client.subscribe(std::string("ticks.") + symbols[i], &sub);
    } else
        client.subscribe(topic_, &sub);

    qlink::connection_id_t connection;
    if (client.connect(endpoint_, &connection) != 0) {
        std::fprintf(stderr, "connect %s: %s\n", endpoint_.c_str(),
                     qlink_strerror(qlink_errno()));
        return 1;
    }

    while (g_running)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    client.close();
    return 0;
}
}

int main(int argc, char *argv[])
{
    bool publish = false;
    std::string endpoint;
    std::string topic;
    int count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--publish")
            publish = true;
        else if ((arg == "--bind" || arg == "--connect") && i + 1 < argc)
            endpoint = argv[++i];
        else if (arg == "--topic" && i + 1 < argc)
            topic = argv[++i];
        else if (arg == "--count" && i + 1 < argc)
            count = std::atoi(argv[++i]);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (publish)
        return run_publisher(endpoint.empty() ? "tcp://*:5601" : endpoint,
                             count);
    return run_subscriber(
      endpoint.empty() ? "tcp://127.0.0.1:5601" : endpoint, topic);
}
