#include "config.hpp"
#include "bar_builder.hpp"
#include "tick_resampler.hpp"
#include "csv_format.hpp"
#include "errors.hpp"
#include "store_pg.hpp"
#include "reference_source.hpp"
#include "quality_check.hpp"
#include "order_log.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("ticklens", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
    nlohmann::json body = {{"error", message}};
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

TickQuery parse_query(const httplib::Request& req) {
    TickQuery query;
    query.instrument_id = util::trim(req.get_param_value("symbol"));
    query.range = util::DateRange::parse(req.get_param_value("date_range"));
    return query;
}

int64_t parse_frequency(const httplib::Request& req, int default_frequency) {
    if (!req.has_param("frequency")) return default_frequency;
    auto freq = util::parse_int64(req.get_param_value("frequency"));
    if (!freq) {
        throw std::invalid_argument("frequency must be an integer number of seconds");
    }
    return *freq;
}

// Aggregates after the headers go out, writing one CSV line per bucket.
// Only used in drop-row mode, where malformed ticks are skipped rather than raised.
template <typename Engine, typename Row>
void stream_csv(httplib::Response& res, Engine engine, std::shared_ptr<std::vector<Tick>> ticks,
                std::string header, std::string (*format_row)(const Row&),
                AggregationStats (Engine::*run)(const std::vector<Tick>&,
                                                const std::function<void(const Row&)>&) const) {
    res.set_chunked_content_provider("text/csv",
        [engine, ticks, header, format_row, run](size_t, httplib::DataSink& sink) {
            sink.write(header.data(), header.size());
            try {
                (engine.*run)(*ticks, [&sink, format_row](const Row& row) {
                    auto line = format_row(row);
                    sink.write(line.data(), line.size());
                });
            } catch (const std::exception& e) {
                spdlog::error("Aborting CSV stream: {}", e.what());
                return false;
            }
            sink.done();
            return true;
        });
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("TickLens Aggregation Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        const auto policy = config->strict_ticks ? MalformedPolicy::FailFast : MalformedPolicy::DropRow;

        // Initialize components
        auto redis = std::make_shared<RedisBus>(config->redis_url);
        std::shared_ptr<TickStore> store =
            std::make_shared<PostgresTickStore>(config->pg_dsn, config->fetch_timeout_ms);
        auto health = std::make_shared<HealthCheck>(redis, store);
        BhavcopySource bhavcopy(config->bhavcopy_dir);
        OrderLog orders(static_cast<size_t>(config->max_placed_orders));

        store->ensure_schema();

        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        server.Get("/ticks", [&](const httplib::Request& req, httplib::Response& res) {
            try {
                auto query = parse_query(req);
                auto frequency = parse_frequency(req, config->default_frequency_seconds);
                TickResampler resampler(frequency, policy);
                auto ticks = std::make_shared<std::vector<Tick>>(store->fetch_ticks_in_range(query));
                spdlog::info("/ticks symbol='{}' freq={}s: {} ticks",
                             query.instrument_id, frequency, ticks->size());
                if (policy == MalformedPolicy::FailFast) {
                    // Aggregate before replying so a bad tick maps to a status code
                    res.set_content(CsvFormat::render(resampler.resample(*ticks)), "text/csv");
                    return;
                }
                stream_csv<TickResampler, ResampledSnapshot>(
                    res, resampler, ticks, CsvFormat::snapshot_header(),
                    &CsvFormat::snapshot_row, &TickResampler::resample);
            } catch (const std::invalid_argument& e) {
                reply_error(res, 400, e.what());
            } catch (const StoreError& e) {
                reply_error(res, 503, e.what());
            } catch (const MalformedTickError& e) {
                reply_error(res, 422, e.what());
            }
        });

        server.Get("/ohlcv", [&](const httplib::Request& req, httplib::Response& res) {
            try {
                auto query = parse_query(req);
                BarBuilder builder(parse_frequency(req, config->default_frequency_seconds), policy);
                auto ticks = std::make_shared<std::vector<Tick>>(store->fetch_ticks_in_range(query));
                spdlog::info("/ohlcv symbol='{}' freq={}s: {} ticks",
                             query.instrument_id, builder.frequency_seconds(), ticks->size());
                if (policy == MalformedPolicy::FailFast) {
                    res.set_content(CsvFormat::render(builder.build_bars(*ticks)), "text/csv");
                    return;
                }
                stream_csv<BarBuilder, Bar>(
                    res, builder, ticks, CsvFormat::bar_header(),
                    &CsvFormat::bar_row, &BarBuilder::build_bars);
            } catch (const std::invalid_argument& e) {
                reply_error(res, 400, e.what());
            } catch (const StoreError& e) {
                reply_error(res, 503, e.what());
            } catch (const MalformedTickError& e) {
                reply_error(res, 422, e.what());
            }
        });

        server.Post("/ticks", [&](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = nlohmann::json::parse(req.body);
                if (!body.is_array()) {
                    reply_error(res, 400, "expected a JSON array of ticks");
                    return;
                }
                std::vector<Tick> ticks;
                ticks.reserve(body.size());
                for (const auto& item : body) {
                    ticks.push_back(Tick::from_json(item));
                }
                auto inserted = store->insert_ticks(ticks);
                res.set_content(nlohmann::json{{"inserted", inserted}}.dump(), "application/json");
            } catch (const nlohmann::json::exception& e) {
                reply_error(res, 400, e.what());
            } catch (const MalformedTickError& e) {
                reply_error(res, 400, e.what());
            } catch (const StoreError& e) {
                reply_error(res, 503, e.what());
            }
        });

        server.Get("/quality-checks", [&](const httplib::Request& req, httplib::Response& res) {
            try {
                auto tdate = util::trim(req.get_param_value("tdate"));
                int64_t trade_date_ms = util::parse_date(tdate);

                QualityCheck check(*store, bhavcopy, policy);
                auto report = check.run(trade_date_ms);
                auto body = report.to_json();

                health->record_quality_check(tdate, report.clean());
                redis->publish_quality_report(config->stream_quality, tdate, body);
                res.set_content(body.dump(), "application/json");
            } catch (const std::invalid_argument& e) {
                reply_error(res, 400, e.what());
            } catch (const ReconciliationSourceUnavailable& e) {
                spdlog::error("Quality check unavailable: {}", e.what());
                reply_error(res, 503, e.what());
            } catch (const MalformedTickError& e) {
                reply_error(res, 422, e.what());
            }
        });

        server.Post("/place-order", [&](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = nlohmann::json::parse(req.body);
                auto order = orders.record(body.at("symbol").get<std::string>(),
                                           body.at("price").get<double>(),
                                           body.at("qty").get<int64_t>());

                nlohmann::json list = nlohmann::json::array();
                for (const auto& o : orders.list()) {
                    list.push_back(o.to_json());
                }
                nlohmann::json reply = {
                    {"message", fmt::format("[SUCCESS] Symbol: {}, Price: {}, Quantity: {}",
                                            order.symbol, order.price, order.qty)},
                    {"orders_list", list}
                };
                res.set_content(reply.dump(), "application/json");
            } catch (const nlohmann::json::exception& e) {
                reply_error(res, 400, e.what());
            } catch (const std::invalid_argument& e) {
                reply_error(res, 400, e.what());
            }
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            if (!server.listen(config->listen_addr.c_str(), config->listen_port)) {
                spdlog::error("HTTP server failed to listen on {}:{}",
                              config->listen_addr, config->listen_port);
                shutdown_requested = true;
            }
        });

        spdlog::info("TickLens started");

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        server.stop();

        if (http_thread.joinable()) http_thread.join();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
