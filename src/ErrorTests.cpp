// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "TestHelpers.hpp"

#include <stdexcept>

using namespace cliargs;

TEST_CASE( "error messages" ) {
    CHECK( Error::osArgsContainInvalidUnicode( 1, "a\xff" ).message()
           == "The command line arguments contain invalid unicode (index: 1, argument: \"a\xef\xbf\xbd\")" );
    CHECK( Error::optionContainsInvalidChar( "foo_bar" ).message()
           == "The option contains invalid character (option: \"foo_bar\")" );
    CHECK( Error::unconfiguredOption( "foo" ).message()
           == "The option is not specified in configurations (option: \"foo\")" );
    CHECK( Error::optionNeedsArg( "f", "foo" ).message()
           == "The option needs argument(s) (option: \"f\")" );
    CHECK( Error::optionTakesNoArg( "foo", "foo" ).message()
           == "The option takes no argument (option: \"foo\")" );
    CHECK( Error::optionIsNotArray( "bar", "bar" ).message()
           == "The option cannot have multiple arguments (option: \"bar\")" );
    CHECK( Error::optionArgIsInvalid( "n", "num", "x", "invalid digit found in string" ).message()
           == "The option argument is invalid (option: \"n\", argument: \"x\", details: \"invalid digit found in string\")" );
    CHECK( Error::storeKeyIsDuplicated( "foo", "f" ).message()
           == "The store key is duplicated (store_key: \"foo\")" );
    CHECK( Error::configIsArrayButHasNoArg( "foo", "f" ).message()
           == "The configuration is specified both being an array and having no argument (store_key: \"foo\")" );
    CHECK( Error::configHasDefaultsButHasNoArg( "foo", "f" ).message()
           == "The configuration is specified both default argument(s) and having no argument (store_key: \"foo\")" );
    CHECK( Error::optionNameIsDuplicated( "foo", "f" ).message()
           == "The option name in the configuration is duplicated (store_key: \"foo\", name: \"f\")" );
}

TEST_CASE( "messages escape their arguments" ) {
    CHECK( Error::unconfiguredOption( "a\"b" ).message()
           == "The option is not specified in configurations (option: \"a\\\"b\")" );
    CHECK( toString( Error::unconfiguredOption( "x" ) ) == Error::unconfiguredOption( "x" ).message() );
}

TEST_CASE( "error families" ) {
    CHECK( Error::osArgsContainInvalidUnicode( 0, "" ).family() == ErrorFamily::Encoding );
    CHECK( Error::optionContainsInvalidChar( "" ).family() == ErrorFamily::OptionUsage );
    CHECK( Error::optionArgIsInvalid( "", "", "", "" ).family() == ErrorFamily::OptionUsage );
    CHECK( Error::storeKeyIsDuplicated( "", "" ).family() == ErrorFamily::Config );
    CHECK( Error::optionNameIsDuplicated( "", "" ).family() == ErrorFamily::Config );

    CHECK( Result::fail( Error::unconfiguredOption( "x" ) ).type() == ResultBase::RuntimeError );
    CHECK( Result::fail( Error::osArgsContainInvalidUnicode( 0, "" ) ).type() == ResultBase::RuntimeError );
    CHECK( Result::fail( Error::configIsArrayButHasNoArg( "x", "x" ) ).type() == ResultBase::LogicError );
}

TEST_CASE( "error accessors" ) {
    auto error = Error::optionArgIsInvalid( "n", "num", "x", "bad" );
    CHECK( error.kind() == ErrorKind::OptionArgIsInvalid );
    CHECK( error.option() == "n" );
    CHECK( error.storeKey() == "num" );
    CHECK( error.optArg() == "x" );
    CHECK( error.details() == "bad" );

    auto config = Error::optionNameIsDuplicated( "foo", "f" );
    CHECK( config.storeKey() == "foo" );
    CHECK( config.option() == "f" );
}

TEST_CASE( "error equality" ) {
    CHECK( Error::unconfiguredOption( "a" ) == Error::unconfiguredOption( "a" ) );
    CHECK( Error::unconfiguredOption( "a" ) != Error::unconfiguredOption( "b" ) );
    CHECK( Error::unconfiguredOption( "a" ) != Error::optionContainsInvalidChar( "a" ) );
    CHECK( Error::optionNeedsArg( "f", "foo" ) != Error::optionNeedsArg( "f", "bar" ) );
}

TEST_CASE( "results" ) {

    SECTION( "ok with a value" ) {
        auto result = BasicResult<int>::ok( 3 );
        REQUIRE( result );
        CHECK( result.type() == ResultBase::Ok );
        CHECK( result.value() == 3 );
        CHECK( result.errorMessage().empty() );
        CHECK_THROWS_AS( result.error(), std::logic_error );
    }
    SECTION( "failed" ) {
        auto result = BasicResult<std::string>::fail( Error::unconfiguredOption( "x" ) );
        REQUIRE_FALSE( result );
        CHECK( result.errorMessage() == Error::unconfiguredOption( "x" ).message() );
        CHECK_THROWS_AS( result.value(), std::logic_error );
    }
    SECTION( "copies keep the value" ) {
        auto result = BasicResult<std::string>::ok( "text" );
        auto copy = result;
        CHECK( copy.value() == "text" );
        copy = BasicResult<std::string>::fail( Error::unconfiguredOption( "x" ) );
        CHECK_FALSE( copy );
        copy = result;
        CHECK( copy.value() == "text" );
    }
    SECTION( "a failure converts to another result type" ) {
        auto failed = BasicResult<int>::fail( Error::storeKeyIsDuplicated( "k", "k" ) );
        Result converted( failed );
        REQUIRE_FALSE( converted );
        CHECK( converted.type() == ResultBase::LogicError );
        CHECK( converted.error() == failed.error() );
    }
    SECTION( "a success does not convert" ) {
        auto success = BasicResult<int>::ok( 1 );
        CHECK_THROWS_AS( Result( success ), std::logic_error );
        CHECK_THROWS_AS( BasicResult<std::string>( success ), std::logic_error );
        CHECK_THROWS_AS( BasicResult<std::vector<std::string>>( BasicResult<std::string>::ok( "x" ) ), std::logic_error );
    }
    SECTION( "a failure converts to a result holding a value" ) {
        auto failed = Result::fail( Error::unconfiguredOption( "x" ) );
        BasicResult<std::string> converted( failed );
        REQUIRE_FALSE( converted );
        CHECK( converted.type() == ResultBase::RuntimeError );
        CHECK_THROWS_AS( converted.value(), std::logic_error );
    }
}
