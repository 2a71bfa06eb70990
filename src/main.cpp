#include "app.hpp"
#include "log.hpp"

/**
 * Program entry point of the huntglitch command line tool.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  hgl::App app;
  int ret = app.run(argc, argv);
  hgl::shutdown_logging();
  return ret;
}
