/**
 * @file app.hpp
 * @brief Entry point logic of the huntglitch command line tool.
 */

#ifndef HUNTGLITCH_APP_HPP
#define HUNTGLITCH_APP_HPP

#include "cli.hpp"
#include "http_client.hpp"
#include <memory>
#include <utility>

namespace hgl {

/// Process exit codes of the command line tool.
enum ExitCode : int {
  kExitDelivered = 0,      ///< Event delivered or configuration valid
  kExitDeliveryFailed = 1, ///< Endpoint did not accept the event
  kExitUsage = 2           ///< Configuration or usage error
};

/**
 * Orchestrates CLI parsing, logging setup, configuration resolution and
 * delivery for one invocation.
 */
class App {
public:
  /**
   * @param http HTTP client to deliver with; a CurlHttpClient is created
   *        from the resolved configuration when null.
   */
  explicit App(std::unique_ptr<HttpClient> http = nullptr)
      : http_(std::move(http)) {}

  /**
   * Run the tool with the given command line arguments.
   *
   * @return One of the ExitCode values.
   */
  int run(int argc, char **argv);

  /// Options parsed by the last run().
  const CliOptions &options() const { return options_; }

private:
  std::unique_ptr<HttpClient> http_;
  CliOptions options_;
};

} // namespace hgl

#endif // HUNTGLITCH_APP_HPP
