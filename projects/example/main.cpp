// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "cliargs.hpp"

#include <iostream>
#include <string>
#include <vector>

// A small harness showing a top level command with a bound configuration
// and a subcommand parsed against plain option configurations.
//
//   cliargs_example --colour=red -v greet --name World -n Everyone

struct Config {
    std::string colour = "blue";
    bool verbose = false;
    bool showHelp = false;
};

int main( int argc, const char * argv[] )
{
    using namespace cliargs;

    auto parsed = Cmd::fromOsArgs( argc, argv );
    if( !parsed ) {
        std::cerr << "Error: " << parsed.errorMessage() << "\n";
        return 1;
    }
    auto &cmd = parsed.value();

    Config config;
    auto store = Field( config.colour, "colour" ).cfg( "colour,c=blue" ).arg( "<colour>" )( "specify a colour" )
               | Field( config.verbose, "verbose" ).cfg( "verbose,v" )( "print the parsed command" )
               | Field( config.showHelp, "help" ).cfg( "help,h" )( "show this help" );

    auto result = cmd.parseUntilSubCmdFor( store );
    if( !result ) {
        std::cerr << "Error: " << result.errorMessage() << "\n";
        return 1;
    }

    std::vector<OptCfg> greetCfgs = {
        OptCfg( "names" )["name"]["n"].hasArg( true ).isArray( true ).argInHelp( "<name>" )( "who to greet" ),
        OptCfg( "times" )["times"].hasArg( true ).defaults( std::vector<std::string>{ "1" } )
            .validator( &validateNumber<unsigned> ).argInHelp( "<n>" )( "how many times" )
    };

    if( config.showHelp ) {
        Help help;
        help.addText( "Usage: " + std::string( cmd.name() ) + " [OPTIONS] greet [GREET OPTIONS]" )
            .addText( "" )
            .addText( "OPTIONS:" )
            .addOptsWithMargin( cmd.cfgs(), 2 )
            .addText( "GREET OPTIONS:" )
            .addOptsWithMargin( greetCfgs, 2 );
        std::cout << help;
        return 0;
    }

    if( config.verbose )
        std::cout << cmd << "\n";

    if( !result.value() ) {
        std::cout << "Hello, " << config.colour << " World!\n";
        return 0;
    }

    auto &sub = *result.value();
    if( sub.name() != "greet" ) {
        std::cerr << "Error: unknown command \"" << sub.name() << "\"\n";
        return 1;
    }

    auto subResult = sub.parseWith( greetCfgs );
    if( !subResult ) {
        std::cerr << "Error: " << subResult.errorMessage() << "\n";
        return 1;
    }
    if( config.verbose )
        std::cout << sub << "\n";

    auto times = std::stoul( std::string( *sub.optArg( "times" ) ) );
    auto names = sub.optArgs( "names" );
    for( unsigned long i = 0; i < times; ++i ) {
        if( !names ) {
            std::cout << "Hello, " << config.colour << " World!\n";
            continue;
        }
        for( auto name : *names )
            std::cout << "Hello, " << config.colour << " " << name << "!\n";
    }
    return 0;
}
