// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "TestHelpers.hpp"

using namespace cliargs;
using cliargs::detail::createOptsHelp;
using cliargs::detail::makeOptTitle;

namespace {
    using Entry = std::pair<std::size_t, std::string>;

    auto spaces( std::size_t n ) -> std::string {
        return std::string( n, ' ' );
    }
}

TEST_CASE( "option titles" ) {

    SECTION( "one long name" ) {
        CHECK( makeOptTitle( OptCfg()["foo-bar"] ) == Entry{ 0, "--foo-bar" } );
    }
    SECTION( "one short name" ) {
        CHECK( makeOptTitle( OptCfg()["f"] ) == Entry{ 0, "-f" } );
    }
    SECTION( "several names" ) {
        CHECK( makeOptTitle( OptCfg()["f"]["b"]["foo-bar"] ) == Entry{ 0, "-f, -b, --foo-bar" } );
    }
    SECTION( "store key only" ) {
        CHECK( makeOptTitle( OptCfg( "Foo_Bar" ) ) == Entry{ 0, "--Foo_Bar" } );
        CHECK( makeOptTitle( OptCfg( "x" ) ) == Entry{ 0, "-x" } );
    }
    SECTION( "empty names line up columns" ) {
        CHECK( makeOptTitle( OptCfg()[""]["f"] ) == Entry{ 4, "-f" } );
        CHECK( makeOptTitle( OptCfg()[""]["f"][""]["b"][""] ) == Entry{ 4, "-f,     -b" } );
    }
    SECTION( "all names empty falls back to the store key" ) {
        CHECK( makeOptTitle( OptCfg( "FooBar" )[""][""] ) == Entry{ 8, "--FooBar" } );
    }
    SECTION( "argument placeholder" ) {
        CHECK( makeOptTitle( OptCfg()["f"].argInHelp( "<n>" ) ) == Entry{ 0, "-f <n>" } );
    }
}

TEST_CASE( "option help entries" ) {

    SECTION( "widest title sets the indent" ) {
        std::size_t indent = 0;
        auto entries = createOptsHelp( { OptCfg()["foo-bar"] }, indent );
        REQUIRE( entries.size() == 1 );
        CHECK( entries[0] == Entry{ 0, "--foo-bar" } );
        CHECK( indent == 11 );
    }
    SECTION( "long name with description" ) {
        std::size_t indent = 0;
        auto entries = createOptsHelp( { OptCfg()["foo-bar"]( "The description of foo-bar." ) }, indent );
        REQUIRE( entries.size() == 1 );
        CHECK( entries[0].second == "--foo-bar  The description of foo-bar." );
        CHECK( indent == 11 );
    }
    SECTION( "long name with description and placeholder" ) {
        std::size_t indent = 0;
        auto entries = createOptsHelp( { OptCfg()["foo-bar"].argInHelp( "<num>" )( "The description of foo-bar." ) }, indent );
        REQUIRE( entries.size() == 1 );
        CHECK( entries[0].second == "--foo-bar <num>  The description of foo-bar." );
        CHECK( indent == 17 );
    }
    SECTION( "short names" ) {
        std::size_t indent = 0;
        CHECK( createOptsHelp( { OptCfg()["f"] }, indent )[0].second == "-f" );
        CHECK( indent == 4 );

        indent = 0;
        CHECK( createOptsHelp( { OptCfg()["f"]( "The description of f." ) }, indent )[0].second == "-f  The description of f." );
        CHECK( indent == 4 );

        indent = 0;
        CHECK( createOptsHelp( { OptCfg()["f"].argInHelp( "<n>" )( "The description of f." ) }, indent )[0].second == "-f <n>  The description of f." );
        CHECK( indent == 8 );
    }
    SECTION( "a given indent is kept" ) {
        std::vector<OptCfg> cfgs = { OptCfg()["foo-bar"].argInHelp( "<num>" )( "The description of foo-bar." ) };

        std::size_t indent = 19;
        CHECK( createOptsHelp( cfgs, indent )[0].second == "--foo-bar <num>    The description of foo-bar." );
        CHECK( indent == 19 );

        indent = 16;
        CHECK( createOptsHelp( cfgs, indent )[0].second == "--foo-bar <num>\n" + spaces( 16 ) + "The description of foo-bar." );
        CHECK( indent == 16 );

        indent = 10;
        CHECK( createOptsHelp( cfgs, indent )[0].second == "--foo-bar <num>\n" + spaces( 10 ) + "The description of foo-bar." );
        CHECK( indent == 10 );
    }
    SECTION( "names with empty strings" ) {
        std::vector<OptCfg> cfgs = {
            OptCfg()[""][""]["f"][""]["foo-bar"][""].argInHelp( "<num>" )( "The description of foo-bar." )
        };

        std::size_t indent = 0;
        auto entries = createOptsHelp( cfgs, indent );
        REQUIRE( entries.size() == 1 );
        CHECK( entries[0].first == 8 );
        CHECK( entries[0].second == "-f,     --foo-bar <num>  The description of foo-bar." );
        CHECK( indent == 33 );

        indent = 35;
        CHECK( createOptsHelp( cfgs, indent )[0].second == "-f,     --foo-bar <num>    The description of foo-bar." );

        indent = 33;
        CHECK( createOptsHelp( cfgs, indent )[0].second == "-f,     --foo-bar <num>  The description of foo-bar." );

        indent = 32;
        CHECK( createOptsHelp( cfgs, indent )[0].second == "-f,     --foo-bar <num>\n" + spaces( 32 ) + "The description of foo-bar." );
    }
    SECTION( "ignored and wildcard configurations are skipped" ) {
        std::size_t indent = 0;
        auto entries = createOptsHelp( { OptCfg()[""], OptCfg( ANY_OPT ), OptCfg()["a"] }, indent );
        REQUIRE( entries.size() == 1 );
        CHECK( entries[0].second == "-a" );
    }
    SECTION( "wide characters count double" ) {
        std::size_t indent = 0;
        auto entries = createOptsHelp( {
            OptCfg()["f"].argInHelp( "<\xe5\x90\x8d\xe5\x89\x8d>" )( "name" ),
            OptCfg()["foo-bar"]( "other" )
        }, indent );
        REQUIRE( entries.size() == 2 );
        CHECK( indent == 11 );
        CHECK( entries[0].second == "-f <\xe5\x90\x8d\xe5\x89\x8d>  name" );
        CHECK( entries[1].second == "--foo-bar  other" );
    }
    SECTION( "multi-line descriptions continue at the indent" ) {
        std::size_t indent = 0;
        auto entries = createOptsHelp( { OptCfg()["foo"]( "first\nsecond" ) }, indent );
        REQUIRE( entries.size() == 1 );
        CHECK( entries[0].second == "--foo  first\n" + spaces( 7 ) + "second" );
    }
}

TEST_CASE( "help blocks" ) {
    std::vector<OptCfg> cfgs = {
        OptCfg( "data" )["d"]["data"].hasArg( true ).argInHelp( "<data>" )( "HTTP POST data" ),
        OptCfg( "include" )["i"]["include"]( "Include protocol response headers in the output" ),
        OptCfg( "user" )["u"]["user"].hasArg( true ).argInHelp( "<user:password>" )( "Server user and password" )
    };

    SECTION( "text and options" ) {
        Help help;
        help.addText( "Usage: curl [options...] <url>" )
            .addOptsWithMargin( cfgs, 1 );

        std::vector<std::string> expected = {
            "Usage: curl [options...] <url>",
            " -d, --data <data>" + spaces( 11 ) + "HTTP POST data",
            " -i, --include" + spaces( 15 ) + "Include protocol response headers in the output",
            " -u, --user <user:password>" + spaces( 2 ) + "Server user and password"
        };
        CHECK( help.lines() == expected );
    }
    SECTION( "help margin applies to every block" ) {
        Help help( 2 );
        help.addText( "a\nb" ).addOptsWithIndent( { OptCfg()["x"]( "desc" ) }, 6 );
        CHECK( help.lines() == std::vector<std::string>{ "  a", "  b", "  -x    desc" } );
    }
    SECTION( "indented text" ) {
        Help help;
        help.addTextWithIndent( "first\nsecond\nthird", 4 );
        CHECK( help.lines() == std::vector<std::string>{ "first", "    second", "    third" } );
    }
    SECTION( "text with margin" ) {
        Help help( 1 );
        help.addTextWithMargin( "first\nsecond", 2 );
        CHECK( help.lines() == std::vector<std::string>{ "   first", "   second" } );
    }
    SECTION( "head spaces apply to the first line only" ) {
        Help help;
        help.addOptsWithIndentAndMargin( { OptCfg()[""]["f"]( "desc" ) }, 4, 1 );
        CHECK( help.lines() == std::vector<std::string>{ "     -f", spaces( 5 ) + "desc" } );
    }
    SECTION( "printing" ) {
        Help help;
        help.addText( "Usage: app" ).addOpts( { OptCfg()["v"]( "verbose" ) } );
        CHECK( toString( help ) == "Usage: app\n-v  verbose\n" );
    }
}
