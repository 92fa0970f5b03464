//  firemote - Fire TV remote control client
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com


#include "app.hpp"
#include "base/conf/cli_args.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char *argv[]) {
  using namespace firemote;

  int rc{1}; // exit code, default to failed

  // handle cli args
  conf::cli_args(argc, argv);

  if (conf::cli_args::nominal_start()) {
    // all is well, proceed with app startup
    App app;

    rc = app.main();

  } else if (conf::cli_args::help()) {
    std::cout << conf::cli_args::help_msg() << std::endl;
    rc = 0;

  } else {
    std::cerr << conf::cli_args::error_msg() << std::endl;
  }

  exit(rc);
}
