#include <fnrun/common/exceptions.hpp>
#include <fnrun/server/config.hpp>
#include <fnrun/server/server.hpp>

#include <csignal>
#include <cstring>

#include <sys/prctl.h>

#include <cereal/details/helpers.hpp>
#include <spdlog/spdlog.h>

void signal_handler(int /*unused*/)
{
  fnrun::server::Server::instance()->shutdown();
}

int main(int argc, char** argv)
{
  // Keeps the configuration and environment away from sandboxes running as the same user.
  if (prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) != 0) {
    spdlog::error("Could not mark the server as not dumpable: {}", strerror(errno));
    return 1;
  }

  fnrun::server::config::Config cfg;
  try {
    cfg = fnrun::server::config::Config::deserialize(argc, argv);
  } catch (fnrun::common::InvalidConfigurationError& exc) {
    spdlog::error("Invalid configuration: {}", exc.what());
    return 1;
  } catch (cereal::Exception& exc) {
    spdlog::error("Could not parse configuration: {}", exc.what());
    return 1;
  }

  if (cfg.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing fnrun server!");

  try {
    fnrun::server::Server::configure(cfg);
  } catch (fnrun::common::FnRunException& exc) {
    spdlog::error("Could not start the server: {}", exc.what());
    return 1;
  }

  // Catch SIGINT and SIGTERM
  struct sigaction sigIntHandler {};
  sigIntHandler.sa_handler = &signal_handler;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;
  sigaction(SIGINT, &sigIntHandler, nullptr);
  sigaction(SIGTERM, &sigIntHandler, nullptr);

  fnrun::server::Server::instance()->run();

  fnrun::server::Server::instance()->wait();

  spdlog::info("Server is closing down");
  return 0;
}
