#include "proxy/client_session.hpp"

#include <chrono>

void record_decision(const SessionServices&   services,
                     const ConnectionContext& ctx,
                     const RequestDescriptor& desc,
                     const Decision&          decision,
                     NetworkMode              mode)
{
    const auto now = std::chrono::system_clock::now();

    if (services.stats) {
        services.stats->on_request(desc.protocol, !decision.allowed);
    }

    if (decision.allowed) {
        if (services.logger) {
            services.logger->log_request(RequestLog{
                .session_id = ctx.session_id,
                .client_ip  = ctx.client_ip,
                .host       = desc.host,
                .port       = desc.port,
                .method     = desc.method.value_or(""),
                .protocol   = std::string{to_string(desc.protocol)},
                .generation = decision.generation,
                .timestamp  = now,
            });
        }
        return;
    }

    if (services.logger) {
        services.logger->log_block(BlockLog{
            .session_id = ctx.session_id,
            .client_ip  = ctx.client_ip,
            .host       = desc.host,
            .port       = desc.port,
            .method     = desc.method.value_or(""),
            .protocol   = std::string{to_string(desc.protocol)},
            .mode       = std::string{to_string(mode)},
            .reason     = std::string{to_string(decision.reason)},
            .generation = decision.generation,
            .timestamp  = now,
        });
    }
    if (services.blocked) {
        services.blocked->record(BlockedRequest{
            .host      = desc.host,
            .reason    = std::string{to_string(decision.reason)},
            .client    = ctx.client_ip,
            .method    = desc.method,
            .mode      = std::string{to_string(mode)},
            .protocol  = std::string{to_string(desc.protocol)},
            .timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                             now.time_since_epoch()).count(),
        });
    }
}

void log_connection_event(const SessionServices&   services,
                          const ConnectionContext& ctx,
                          std::string_view         event)
{
    if (!services.logger) {
        return;
    }
    services.logger->log_connection(ConnectionLog{
        .session_id  = ctx.session_id,
        .event       = std::string{event},
        .protocol    = std::string{to_string(ctx.protocol)},
        .client_ip   = ctx.client_ip,
        .client_port = ctx.client_port,
        .timestamp   = std::chrono::system_clock::now(),
    });
}
