// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "TestHelpers.hpp"

using namespace cliargs;
using cliargs::detail::Schema;

TEST_CASE( "OptCfg builder" ) {

    auto cfg = OptCfg( "count" )
        ["count"]["c"]
        .hasArg( true )
        .isArray( true )
        .defaults( std::vector<std::string>{ "1", "2" } )
        .argInHelp( "<n>" )
        ( "number of items" );

    CHECK( cfg.storeKey() == "count" );
    CHECK( cfg.names() == std::vector<std::string>{ "count", "c" } );
    CHECK( cfg.hasArg() );
    CHECK( cfg.isArray() );
    REQUIRE( cfg.defaults() );
    CHECK( *cfg.defaults() == std::vector<std::string>{ "1", "2" } );
    CHECK( cfg.argInHelp() == "<n>" );
    CHECK( cfg.desc() == "number of items" );
    CHECK_FALSE( cfg.validator() );
}

TEST_CASE( "effective store key" ) {
    CHECK( OptCfg( "key" )["name"].effectiveStoreKey() == "key" );
    CHECK( OptCfg()["name"]["n"].effectiveStoreKey() == "name" );
    CHECK( OptCfg()[""]["n"].effectiveStoreKey() == "n" );
    CHECK( OptCfg()[""][""].effectiveStoreKey() == "" );
    CHECK( OptCfg()[""][""].isIgnored() );
    CHECK( OptCfg( ANY_OPT ).isWildcard() );
}

TEST_CASE( "validate" ) {

    SECTION( "without a validator everything passes" ) {
        CHECK( OptCfg( "foo" ).validate( "foo", "foo", "anything" ) );
    }
    SECTION( "with a validator" ) {
        auto cfg = OptCfg( "num" ).validator( &cliargs::validateNumber<int> );
        CHECK( cfg.validate( "num", "n", "12" ) );
        auto result = cfg.validate( "num", "n", "x" );
        REQUIRE_FALSE( result );
        CHECK( result.error().kind() == ErrorKind::OptionArgIsInvalid );
    }
}

TEST_CASE( "schema building" ) {

    SECTION( "indexes names and store keys" ) {
        std::vector<OptCfg> cfgs = {
            OptCfg()["foo-bar"]["f"],
            OptCfg( "baz" )["z"].hasArg( true ),
            OptCfg( "qux" )
        };
        auto schema = Schema::build( cfgs );
        REQUIRE( schema );
        CHECK( schema.value().find( "foo-bar" ) == &cfgs[0] );
        CHECK( schema.value().find( "f" ) == &cfgs[0] );
        CHECK( schema.value().find( "z" ) == &cfgs[1] );
        CHECK( schema.value().find( "baz" ) == nullptr );
        CHECK( schema.value().find( "qux" ) == &cfgs[2] );
        CHECK( schema.value().findByStoreKey( "baz" ) == &cfgs[1] );
        CHECK( schema.value().takesArg( "z" ) );
        CHECK_FALSE( schema.value().takesArg( "f" ) );
        CHECK_FALSE( schema.value().takesArg( "unknown" ) );
        CHECK_FALSE( schema.value().hasWildcard() );
    }
    SECTION( "wildcard" ) {
        std::vector<OptCfg> cfgs = { OptCfg( ANY_OPT ), OptCfg()["foo"] };
        auto schema = Schema::build( cfgs );
        REQUIRE( schema );
        CHECK( schema.value().hasWildcard() );
        CHECK( schema.value().find( "*" ) == nullptr );
    }
    SECTION( "ignored configurations" ) {
        std::vector<OptCfg> cfgs = { OptCfg()[""], OptCfg(), OptCfg()["foo"] };
        CHECK( Schema::build( cfgs ) );
    }
    SECTION( "duplicated store key" ) {
        std::vector<OptCfg> cfgs = { OptCfg( "foo" )["a"], OptCfg( "foo" )["b"] };
        auto schema = Schema::build( cfgs );
        REQUIRE_FALSE( schema );
        CHECK( schema.type() == ResultBase::LogicError );
        CHECK( schema.error() == Error::storeKeyIsDuplicated( "foo", "b" ) );
    }
    SECTION( "duplicated name" ) {
        std::vector<OptCfg> cfgs = { OptCfg()["foo"]["f"], OptCfg()["bar"]["f"] };
        auto schema = Schema::build( cfgs );
        REQUIRE_FALSE( schema );
        CHECK( schema.error() == Error::optionNameIsDuplicated( "bar", "f" ) );
        CHECK( schema.error().option() == "f" );
    }
    SECTION( "array without argument" ) {
        std::vector<OptCfg> cfgs = { OptCfg()["foo"].isArray( true ) };
        auto schema = Schema::build( cfgs );
        REQUIRE_FALSE( schema );
        CHECK( schema.error() == Error::configIsArrayButHasNoArg( "foo", "foo" ) );
    }
    SECTION( "defaults without argument" ) {
        std::vector<OptCfg> cfgs = { OptCfg( "foo" )["f"].defaults( std::vector<std::string>{ "x" } ) };
        auto schema = Schema::build( cfgs );
        REQUIRE_FALSE( schema );
        CHECK( schema.error() == Error::configHasDefaultsButHasNoArg( "foo", "f" ) );
    }
    SECTION( "empty defaults without argument are allowed" ) {
        std::vector<OptCfg> cfgs = { OptCfg()["foo"].defaults( std::vector<std::string>{} ) };
        CHECK( Schema::build( cfgs ) );
    }
}
