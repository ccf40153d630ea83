#include <cstdlib>
#include <iostream>

#include "lore_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  try
  {
    const char *api_base_url = std::getenv(lore_cli::CliHandler::URL_ENV_VAR);
    std::string base_url = (api_base_url && *api_base_url) ? api_base_url
                                                           : lore_cli::CliHandler::DEFAULT_URL;

    lore_cli::CliOptions options = lore_cli::CliHandler::parse_arguments(argc, argv);

    lore_cli::CliHandler handler(base_url);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
