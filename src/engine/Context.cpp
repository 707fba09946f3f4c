#include "engine/Context.hpp"
#include "config/paths.hpp"

#include <unistd.h>

using namespace trashy::engine;

Context::Context(config::Config cfg) : Context(cfg, resolverOptionsFor(cfg)) {}

Context::Context(config::Config cfg, volume::ResolverOptions resolverOpts)
    : config_(std::move(cfg)),
      resolver_(std::move(resolverOpts)),
      namer_(config_.trash.max_name_attempts) {}

trashy::volume::ResolverOptions Context::resolverOptionsFor(const config::Config& cfg) {
    volume::ResolverOptions opts;
    opts.home_trash = cfg.trash.home_dir.empty() ? paths::getDefaultHomeTrash() : cfg.trash.home_dir;
    opts.use_topdir_trash = cfg.trash.use_topdir_trash;
    opts.uid = ::getuid();
    return opts;
}
