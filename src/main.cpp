// =============================================================================
// FILE: src/main.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include "common/slow_task_logger.h"
#include "dispatch/call_dispatcher.h"
#include "handle/handle_codec.h"
#include "sip/sip_dialog_id.h"
#include "sip/sip_message.h"
#include "subscription/remote_correlator.h"
#include "subscription/subscription_handle.h"
#include "subscription/subscription_id.h"
#include "subscription/subscription_query.h"
#include "subscription/subscription_state.h"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace sip_subscription;

static void usage(const char* prog) {
    std::fprintf(stderr,
        "usage: %s [-c config.ini] [-s service_id] <command> [args]\n"
        "  classify <handle>                     handle kind\n"
        "  decode <handle>                       fields of a U_ or D_ handle\n"
        "  encode <service> <sub> <dialog> <call> build a U_ handle\n"
        "  state <header-value>                  parse Subscription-State\n"
        "  message <file> [in|out]               subscription of a SIP message\n"
        "  correlate                             two-sided dialog walkthrough\n",
        prog);
}

static int cmd_classify(const std::string& handle) {
    std::printf("%s\n", handle_kind_to_string(HandleCodec::classify(handle)));
    return 0;
}

static int cmd_decode(const std::string& handle) {
    switch (HandleCodec::classify(handle)) {
        case HandleKind::kSubscription: {
            SubscriptionHandle h;
            Result r = HandleCodec::decode(handle, h);
            if (r != Result::kOk) {
                std::fprintf(stderr, "decode failed: %s\n", result_to_string(r));
                return 1;
            }
            std::printf("service_id=%s\nsubscription_id=%s\ndialog_id=%s\ncall_id=%s\n",
                        h.service_id.c_str(), h.subscription_id.c_str(),
                        h.dialog_id.c_str(), h.call_id.c_str());
            return 0;
        }
        case HandleKind::kDialog: {
            DialogHandle h;
            Result r = HandleCodec::decode(handle, h);
            if (r != Result::kOk) {
                std::fprintf(stderr, "decode failed: %s\n", result_to_string(r));
                return 1;
            }
            std::printf("service_id=%s\ndialog_id=%s\ncall_id=%s\n",
                        h.service_id.c_str(), h.dialog_id.c_str(), h.call_id.c_str());
            return 0;
        }
        default:
            std::fprintf(stderr, "decode failed: %s\n", result_to_string(Result::kInvalidHandle));
            return 1;
    }
}

static int cmd_state(const std::string& value) {
    SubscriptionState state = SubscriptionStateParser::parse(value);
    std::printf("%s\n", SubscriptionStateParser::render(state).c_str());
    return state.is_valid() ? 0 : 1;
}

static int cmd_message(const ServiceId& service_id, const std::string& path, SipDirection dir) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open message file: %s", path.c_str());
        return 1;
    }
    std::stringstream buf;
    buf << file.rdbuf();

    auto msg = SipMessage::parse(service_id, dir, buf.str());
    if (!msg) {
        std::fprintf(stderr, "not a usable SIP message: %s\n", path.c_str());
        return 1;
    }

    std::printf("class=%s\n", message_class_to_string(msg->msg_class));
    std::printf("cseq=%u %s\n", msg->cseq, msg->cseq_method.c_str());
    std::printf("call_id=%s\ndialog_id=%s\n", msg->call_id.c_str(), msg->dialog_id.c_str());
    std::printf("subscription_id=%s\n", SubscriptionIdDeriver::derive(*msg).c_str());
    std::printf("handle=%s\n", SubscriptionHandles::get_handle(*msg).c_str());
    if (!msg->subscription_state.empty()) {
        std::printf("state=%s\n",
                    SubscriptionStateParser::render(SubscriptionStateParser::parse(*msg)).c_str());
    }
    return 0;
}

// One call seen from both ends: service "uac" sent the SUBSCRIBE, service
// "uas" received it. Each side's handle maps onto the other's.
static int cmd_correlate(const Config& config) {
    auto slow_logger = std::make_shared<SlowTaskLogger>(config);
    CallDispatcher dispatcher(config, slow_logger);
    if (dispatcher.start() != Result::kOk) {
        LOG_FATAL("Dispatcher start failed");
        return 1;
    }

    const CallId call_id = "walkthrough-call@example.invalid";
    const std::string uac_tag = "uac-tag", uas_tag = "uas-tag";
    HeaderToken event = HeaderTokenizer::tokenize("dialog;id=1").front();

    std::vector<std::string> handles;
    for (const ServiceId service : {ServiceId("uac"), ServiceId("uas")}) {
        bool is_uac = service == "uac";
        Dialog dialog;
        dialog.service_id = service;
        dialog.call_id    = call_id;
        dialog.local_tag  = is_uac ? uac_tag : uas_tag;
        dialog.remote_tag = is_uac ? uas_tag : uac_tag;
        dialog.id = DialogIdBuilder::build(call_id, dialog.local_tag, dialog.remote_tag);

        Subscription sub;
        sub.id = SubscriptionIdDeriver::for_event(event);
        sub.event = event;
        sub.status = SubscriptionState::active(3600);
        sub.answered = true;
        dialog.subscriptions.push_back(sub);
        handles.push_back(SubscriptionHandles::get_handle(sub, dialog));

        Result r = dispatcher.create_call(service, call_id);
        if (r == Result::kOk) {
            r = dispatcher.apply_call(service, call_id,
                                      [&dialog](Call& call) { return call.add_dialog(dialog); });
        }
        if (r != Result::kOk) {
            std::fprintf(stderr, "%s: cannot install dialog: %s\n",
                         service.c_str(), result_to_string(r));
            return 1;
        }
    }

    RemoteCorrelator correlator(dispatcher);
    SubscriptionQuery query(dispatcher);
    const std::vector<std::string> fields = {"internal_id", "status", "raw_event",
                                             "service_id", "local_tag", "remote_tag"};
    int rc = 0;
    for (size_t i = 0; i < handles.size(); ++i) {
        const std::string& peer_service = (i == 0) ? "uas" : "uac";
        std::string remote;
        Result r = correlator.remote_handle(handles[i], peer_service, remote);
        std::printf("handle=%s\n  remote=%s (%s, %s)\n", handles[i].c_str(),
                    remote.c_str(), result_to_string(r),
                    remote == handles[1 - i] ? "matches peer" : "MISMATCH");
        if (r != Result::kOk || remote != handles[1 - i]) rc = 1;

        MetaList metas;
        r = query.remote_metas(fields, handles[i], metas);
        if (r != Result::kOk) {
            std::fprintf(stderr, "  metas: %s\n", result_to_string(r));
            rc = 1;
            continue;
        }
        for (const auto& [name, value] : metas) {
            std::printf("  %s=%s\n", name.c_str(), meta_value_to_string(value).c_str());
        }
    }

    auto agg = dispatcher.aggregate_stats();
    LOG_INFO("Stats: tasks=%lu/%lu calls=%lu slow=%lu",
             static_cast<unsigned long>(agg.total_tasks_processed),
             static_cast<unsigned long>(agg.total_tasks_received),
             static_cast<unsigned long>(agg.total_calls_active),
             static_cast<unsigned long>(agg.total_slow_tasks));
    dispatcher.stop();
    return rc;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    ServiceId service_id;
    int opt;
    while ((opt = getopt(argc, argv, "c:s:h")) != -1) {
        switch (opt) {
            case 'c': config_path = optarg; break;
            case 's': service_id = optarg; break;
            default:  usage(argv[0]); return (opt == 'h') ? 0 : 2;
        }
    }
    if (optind >= argc) { usage(argv[0]); return 2; }

    Logger::instance().set_level(LogLevel::kWarn);
    Config config = config_path.empty() ? Config::load_defaults()
                                        : Config::load_from_file(config_path);
    if (!config_path.empty()) {
        Logger::instance().configure(config.logging_options());
        Logger::instance().set_level(parse_log_level(config.log_level_str));
    }
    if (service_id.empty()) service_id = config.service_id;

    std::string cmd = argv[optind];
    std::vector<std::string> args(argv + optind + 1, argv + argc);

    int rc = 2;
    if (cmd == "classify" && args.size() == 1) {
        rc = cmd_classify(args[0]);
    } else if (cmd == "decode" && args.size() == 1) {
        rc = cmd_decode(args[0]);
    } else if (cmd == "encode" && args.size() == 4) {
        std::printf("%s\n", HandleCodec::encode(
            SubscriptionHandle{args[0], args[1], args[2], args[3]}).c_str());
        rc = 0;
    } else if (cmd == "state" && args.size() == 1) {
        rc = cmd_state(args[0]);
    } else if (cmd == "message" && (args.size() == 1 || args.size() == 2)) {
        SipDirection dir = (args.size() == 2 && args[1] == "out") ? SipDirection::kOutgoing
                                                                  : SipDirection::kIncoming;
        rc = cmd_message(service_id, args[0], dir);
    } else if (cmd == "correlate" && args.empty()) {
        rc = cmd_correlate(config);
    } else {
        usage(argv[0]);
    }

    Logger::instance().flush_all();
    return rc;
}
