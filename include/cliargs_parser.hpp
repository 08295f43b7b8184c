// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_PARSER_HPP_INCLUDED
#define CLIARGS_PARSER_HPP_INCLUDED

#include "cliargs_opt_cfg.hpp"
#include "cliargs_result.hpp"
#include "cliargs_token.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cliargs {
namespace detail {

    // storeKey -> collected arguments, in input order
    using OptionMap = std::map<std::string, std::vector<std::string_view>, std::less<>>;

    struct ParseOutcome {
        // Index of the first positional argument, set only when parsing
        // stopped there to hand over to a subcommand
        std::optional<std::size_t> subCmdIndex;
        bool isAfterEndOpt = false;
    };

    using ParseOutcomeResult = BasicResult<ParseOutcome>;

    // Records the first failure only
    class FirstError {
        std::optional<Error> m_error;

    public:
        void record( Result const &result ) {
            if( !result && !m_error )
                m_error = result.error();
        }
        void record( Error error ) {
            if( !m_error )
                m_error = std::move( error );
        }

        explicit operator bool() const { return m_error.has_value(); }
        auto get() const -> Error const& { return *m_error; }
    };

    // Drives the recogniser over `args` (the arguments after the program name).
    // `isAfterEndOpt` holds the latched end-of-options state on entry and on
    // return, including when an error is returned.
    //
    //   collectArg( std::string_view arg )
    //   collectOpt( std::string_view name, std::optional<std::string_view> value ) -> Result
    //   takesArg( std::string_view name ) -> bool
    //
    // Parsing never stops at a usage error: the first one is kept, the remaining
    // arguments are still traversed and the kept error is returned at the end, or
    // at the subcommand boundary when `untilFirstArg` is set.
    template<typename CollectArg, typename CollectOpt, typename TakesArg>
    auto parseArgs(
            std::vector<std::string_view> const &args,
            bool &isAfterEndOpt,
            CollectArg &&collectArg,
            CollectOpt &&collectOpt,
            TakesArg &&takesArg,
            bool untilFirstArg ) -> ParseOutcomeResult {

        FirstError firstError;
        std::string_view pendingOpt;

        auto stopAt = [&]( std::size_t index ) -> ParseOutcomeResult {
            if( firstError )
                return ParseOutcomeResult::fail( firstError.get() );
            return ParseOutcomeResult::ok( ParseOutcome{ index, isAfterEndOpt } );
        };

        auto collectLast = [&]( std::string_view name, std::size_t index ) {
            if( takesArg( name ) && index + 1 < args.size() )
                pendingOpt = name;
            else
                firstError.record( collectOpt( name, std::nullopt ) );
        };

        for( std::size_t i = 0; i < args.size(); ++i ) {
            auto arg = args[i];

            if( isAfterEndOpt ) {
                if( untilFirstArg )
                    return stopAt( i );
                collectArg( arg );
                continue;
            }

            if( !pendingOpt.empty() ) {
                firstError.record( collectOpt( pendingOpt, arg ) );
                pendingOpt = std::string_view();
                continue;
            }

            auto token = recognise( arg );
            switch( token.type ) {
                case TokenType::EndOfOptions:
                    isAfterEndOpt = true;
                    break;

                case TokenType::LongOption:
                    if( !token.valid )
                        firstError.record( Error::optionContainsInvalidChar( std::string( token.name ) ) );
                    else if( token.inlineValue )
                        firstError.record( collectOpt( token.name, token.inlineValue ) );
                    else
                        collectLast( token.name, i );
                    break;

                case TokenType::ShortCluster: {
                    // every valid character but the last one is a flag
                    std::string_view name;
                    for( auto const &shortName : token.shortNames ) {
                        if( !name.empty() )
                            firstError.record( collectOpt( name, std::nullopt ) );
                        if( shortName.valid ) {
                            name = shortName.name;
                        } else {
                            firstError.record( Error::optionContainsInvalidChar( std::string( shortName.name ) ) );
                            name = std::string_view();
                        }
                    }
                    if( name.empty() )
                        break;
                    if( token.inlineValue )
                        firstError.record( collectOpt( name, token.inlineValue ) );
                    else
                        collectLast( name, i );
                    break;
                }

                case TokenType::BareDash:
                case TokenType::Positional:
                    if( untilFirstArg )
                        return stopAt( i );
                    collectArg( arg );
                    break;
            }
        }

        if( firstError )
            return ParseOutcomeResult::fail( firstError.get() );
        return ParseOutcomeResult::ok( ParseOutcome{ std::nullopt, isAfterEndOpt } );
    }

    // Collects options against a schema
    class SchemaCollector {
        Schema const &m_schema;
        OptionMap &m_opts;

    public:
        SchemaCollector( Schema const &schema, OptionMap &opts )
        :   m_schema( schema ),
            m_opts( opts )
        {}

        auto takesArg( std::string_view name ) const -> bool {
            return m_schema.takesArg( name );
        }

        auto operator()( std::string_view name, std::optional<std::string_view> value ) -> Result {
            auto cfg = m_schema.find( name );
            if( !cfg ) {
                if( !m_schema.hasWildcard() )
                    return Result::fail( Error::unconfiguredOption( std::string( name ) ) );

                // accepted verbatim, there is nothing to validate against
                auto &values = valuesOf( name );
                if( value )
                    values.push_back( *value );
                return Result::ok();
            }

            auto storeKey = cfg->effectiveStoreKey();
            if( value ) {
                if( !cfg->hasArg() )
                    return Result::fail( Error::optionTakesNoArg( std::string( name ), storeKey ) );

                auto it = m_opts.find( storeKey );
                if( it != m_opts.end() && !it->second.empty() && !cfg->isArray() )
                    return Result::fail( Error::optionIsNotArray( std::string( name ), storeKey ) );

                auto validated = cfg->validate( storeKey, name, *value );
                if( !validated )
                    return validated;

                valuesOf( storeKey ).push_back( *value );
                return Result::ok();
            }

            if( cfg->hasArg() )
                return Result::fail( Error::optionNeedsArg( std::string( name ), storeKey ) );

            valuesOf( storeKey );
            return Result::ok();
        }

    private:
        auto valuesOf( std::string_view key ) -> std::vector<std::string_view> & {
            auto it = m_opts.find( key );
            if( it == m_opts.end() )
                it = m_opts.emplace( std::string( key ), std::vector<std::string_view>() ).first;
            return it->second;
        }
    };

    // Adds the defaults of every configuration whose key was not given.
    // `store( std::string const& )` copies a default into storage owned by the
    // invocation and returns a view of the copy. Defaults are not validated.
    template<typename Store>
    void applyDefaults( std::vector<OptCfg> const &cfgs, OptionMap &opts, Store &&store ) {
        for( auto const &cfg : cfgs ) {
            auto storeKey = cfg.effectiveStoreKey();
            if( storeKey.empty() || storeKey == ANY_OPT )
                continue;
            if( opts.find( storeKey ) != opts.end() )
                continue;
            if( !cfg.defaults() )
                continue;

            auto &values = opts[storeKey];
            for( auto const &def : *cfg.defaults() )
                values.push_back( store( def ) );
        }
    }

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_PARSER_HPP_INCLUDED
