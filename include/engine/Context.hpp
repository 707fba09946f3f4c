#pragma once

#include "config/Config.hpp"
#include "store/Namer.hpp"
#include "volume/Resolver.hpp"

namespace trashy::engine {

/**
 * Process-scoped state shared by engine operations: configuration, the
 * volume -> store cache and the naming policy. Built explicitly by the caller,
 * so independent engines (e.g. one per test) can coexist in one process.
 */
class Context {
public:
    explicit Context(config::Config cfg);
    Context(config::Config cfg, volume::ResolverOptions resolverOpts);

    [[nodiscard]] const config::Config& config() const { return config_; }
    [[nodiscard]] volume::Resolver& resolver() { return resolver_; }
    [[nodiscard]] const store::Namer& namer() const { return namer_; }

    static volume::ResolverOptions resolverOptionsFor(const config::Config& cfg);

private:
    config::Config config_;
    volume::Resolver resolver_;
    store::Namer namer_;
};

}
