// Copyright 2024 The cliargs authors. All rights reserved.
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#ifndef CLIARGS_CMD_HPP_INCLUDED
#define CLIARGS_CMD_HPP_INCLUDED

#include "cliargs_config.hpp"
#include "cliargs_opt_cfg.hpp"
#include "cliargs_parser.hpp"
#include "cliargs_result.hpp"
#include "cliargs_store.hpp"
#include "cliargs_text.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cliargs {
namespace detail {

    // The text after the last path separator, ignoring trailing separators
    inline auto baseName( std::string_view path ) -> std::string_view {
        auto last = path.find_last_not_of( CLIARGS_CONFIG_PATH_SEPARATORS );
        if( last == std::string_view::npos )
            return std::string_view();
        path = path.substr( 0, last + 1 );
        auto lastSep = path.find_last_of( CLIARGS_CONFIG_PATH_SEPARATORS );
        return lastSep == std::string_view::npos ? path : path.substr( lastSep + 1 );
    }

    // One program invocation: its name, positional arguments and options.
    //
    // Every view handed out by a Cmd points into text owned by the Cmd. A child
    // Cmd returned by one of the parseUntilSubCmd functions shares that text, so
    // views stay valid as long as either of them is alive.
    class Cmd {
        struct Storage {
            std::vector<std::string> args;
            // One copy of each default value, kept for every parse that used it
            std::set<std::string, std::less<>> texts;
        };

        std::shared_ptr<Storage> m_storage;
        std::size_t m_begin = 0;
        std::size_t m_end = 0;

        std::string_view m_name;
        std::vector<std::string_view> m_args;
        OptionMap m_opts;
        std::vector<OptCfg> m_cfgs;
        bool m_inheritedEndOpt = false;
        bool m_isAfterEndOpt = false;

        Cmd( std::shared_ptr<Storage> storage, std::size_t begin, std::size_t end, bool isAfterEndOpt )
        :   m_storage( std::move( storage ) ),
            m_begin( begin ),
            m_end( end ),
            m_inheritedEndOpt( isAfterEndOpt ),
            m_isAfterEndOpt( isAfterEndOpt )
        {
            // a subcommand's name is taken as is
            m_name = m_storage->args[m_begin];
        }

        static auto makeStorage( std::vector<std::string> args ) -> std::shared_ptr<Storage> {
            auto storage = std::make_shared<Storage>();
            storage->args = std::move( args );
            return storage;
        }

        void setNameFromPath() {
            if( m_end > m_begin )
                m_name = baseName( m_storage->args[m_begin] );
        }

        auto argViews() const -> std::vector<std::string_view> {
            std::vector<std::string_view> views;
            if( m_end > m_begin )
                views.reserve( m_end - m_begin - 1 );
            for( auto i = m_begin + 1; i < m_end; ++i )
                views.emplace_back( m_storage->args[i] );
            return views;
        }

        auto storeText( std::string const &text ) -> std::string_view {
            return *m_storage->texts.insert( text ).first;
        }

        void reset() {
            m_args.clear();
            m_opts.clear();
            m_isAfterEndOpt = m_inheritedEndOpt;
        }

        auto collectArgFn() {
            return [this]( std::string_view arg ) { m_args.push_back( arg ); };
        }

        auto parseSchemaFree( bool untilFirstArg ) -> ParseOutcomeResult;
        auto parseSchema( bool untilFirstArg ) -> ParseOutcomeResult;
        auto makeSubCmd( ParseOutcome const &outcome ) -> std::optional<Cmd>;

    public:
        Cmd() : m_storage( std::make_shared<Storage>() ) {}

        explicit Cmd( std::vector<std::string> args )
        :   m_storage( makeStorage( std::move( args ) ) ),
            m_end( m_storage->args.size() )
        {
            setNameFromPath();
        }

        Cmd( std::initializer_list<std::string> args )
        :   m_storage( makeStorage( std::vector<std::string>( args ) ) ),
            m_end( m_storage->args.size() )
        {
            setNameFromPath();
        }

        // The arguments are trusted to be UTF-8. Use fromOsArgs to have them checked.
        Cmd( int argc, char const* const* argv )
        :   m_storage( makeStorage( std::vector<std::string>( argv, argv + argc ) ) ),
            m_end( m_storage->args.size() )
        {
            setNameFromPath();
        }

        static auto fromOsArgs( int argc, char const* const* argv ) -> BasicResult<Cmd>;

        auto name() const -> std::string_view { return m_name; }
        auto args() const -> std::vector<std::string_view> const& { return m_args; }
        auto opts() const -> OptionMap const& { return m_opts; }
        auto cfgs() const -> std::vector<OptCfg> const& { return m_cfgs; }
        auto isAfterEndOpt() const -> bool { return m_isAfterEndOpt; }

        auto hasOpt( std::string_view storeKey ) const -> bool {
            return m_opts.find( storeKey ) != m_opts.end();
        }

        // The first argument of the option, or nothing if the option was not
        // given or was given without an argument
        auto optArg( std::string_view storeKey ) const -> std::optional<std::string_view> {
            auto it = m_opts.find( storeKey );
            if( it == m_opts.end() || it->second.empty() )
                return std::nullopt;
            return it->second.front();
        }

        // Null if the option was not given, empty if it was given without arguments
        auto optArgs( std::string_view storeKey ) const -> std::vector<std::string_view> const* {
            auto it = m_opts.find( storeKey );
            return it == m_opts.end() ? nullptr : &it->second;
        }

        // Parses without configurations. Every option is accepted and none takes
        // a separate argument.
        auto parse() -> Result {
            auto outcome = parseSchemaFree( false );
            return outcome ? Result::ok() : Result( outcome );
        }

        auto parseWith( std::vector<OptCfg> cfgs ) -> Result {
            m_cfgs = std::move( cfgs );
            auto outcome = parseSchema( false );
            return outcome ? Result::ok() : Result( outcome );
        }

        auto parseFor( OptStore const &store ) -> Result {
            auto result = parseWith( store.makeOptCfgs() );
            if( !result )
                return result;
            return store.setFieldValues( m_opts );
        }

        // These stop at the first positional argument and return a Cmd for the
        // rest of the arguments, or nothing if there was no positional argument.
        auto parseUntilSubCmd() -> BasicResult<std::optional<Cmd>>;
        auto parseUntilSubCmdWith( std::vector<OptCfg> cfgs ) -> BasicResult<std::optional<Cmd>>;
        auto parseUntilSubCmdFor( OptStore const &store ) -> BasicResult<std::optional<Cmd>>;

        void writeToStream( std::ostream &os ) const {
            os << "Cmd { name: \"" << escape( m_name ) << "\", args: [";
            bool first = true;
            for( auto arg : m_args ) {
                os << ( first ? "" : ", " ) << '"' << escape( arg ) << '"';
                first = false;
            }
            os << "], opts: {";
            first = true;
            for( auto const &opt : m_opts ) {
                os << ( first ? "" : ", " ) << '"' << escape( opt.first ) << "\": [";
                bool firstValue = true;
                for( auto value : opt.second ) {
                    os << ( firstValue ? "" : ", " ) << '"' << escape( value ) << '"';
                    firstValue = false;
                }
                os << ']';
                first = false;
            }
            os << "} }";
        }

        friend auto operator<<( std::ostream &os, Cmd const &cmd ) -> std::ostream& {
            cmd.writeToStream( os );
            return os;
        }
    };

    inline auto Cmd::fromOsArgs( int argc, char const* const* argv ) -> BasicResult<Cmd> {
        for( int i = 0; i < argc; ++i ) {
            std::string_view arg( argv[i] );
            if( !isValidUtf8( arg ) )
                return BasicResult<Cmd>::fail( Error::osArgsContainInvalidUnicode( static_cast<std::size_t>( i ), std::string( arg ) ) );
        }
        return BasicResult<Cmd>::ok( Cmd( argc, argv ) );
    }

    inline auto Cmd::parseSchemaFree( bool untilFirstArg ) -> ParseOutcomeResult {
        reset();
        auto collectOpt = [this]( std::string_view name, std::optional<std::string_view> value ) -> Result {
            auto it = m_opts.find( name );
            if( it == m_opts.end() )
                it = m_opts.emplace( std::string( name ), std::vector<std::string_view>() ).first;
            if( value )
                it->second.push_back( *value );
            return Result::ok();
        };
        auto takesArg = []( std::string_view ) { return false; };

        return parseArgs( argViews(), m_isAfterEndOpt, collectArgFn(), collectOpt, takesArg, untilFirstArg );
    }

    inline auto Cmd::parseSchema( bool untilFirstArg ) -> ParseOutcomeResult {
        reset();
        auto schema = Schema::build( m_cfgs );
        if( !schema )
            return ParseOutcomeResult( schema );

        SchemaCollector collector( schema.value(), m_opts );
        auto takesArg = [&collector]( std::string_view name ) { return collector.takesArg( name ); };

        auto outcome = parseArgs( argViews(), m_isAfterEndOpt, collectArgFn(), collector, takesArg, untilFirstArg );
        if( !outcome )
            return outcome;

        applyDefaults( m_cfgs, m_opts, [this]( std::string const &text ) { return storeText( text ); } );
        return outcome;
    }

    inline auto Cmd::makeSubCmd( ParseOutcome const &outcome ) -> std::optional<Cmd> {
        if( !outcome.subCmdIndex )
            return std::nullopt;
        return Cmd( m_storage, m_begin + 1 + *outcome.subCmdIndex, m_end, outcome.isAfterEndOpt );
    }

    inline auto Cmd::parseUntilSubCmd() -> BasicResult<std::optional<Cmd>> {
        auto outcome = parseSchemaFree( true );
        if( !outcome )
            return BasicResult<std::optional<Cmd>>( outcome );
        return BasicResult<std::optional<Cmd>>::ok( makeSubCmd( outcome.value() ) );
    }

    inline auto Cmd::parseUntilSubCmdWith( std::vector<OptCfg> cfgs ) -> BasicResult<std::optional<Cmd>> {
        m_cfgs = std::move( cfgs );
        auto outcome = parseSchema( true );
        if( !outcome )
            return BasicResult<std::optional<Cmd>>( outcome );
        return BasicResult<std::optional<Cmd>>::ok( makeSubCmd( outcome.value() ) );
    }

    inline auto Cmd::parseUntilSubCmdFor( OptStore const &store ) -> BasicResult<std::optional<Cmd>> {
        auto result = parseUntilSubCmdWith( store.makeOptCfgs() );
        if( !result )
            return result;
        auto setResult = store.setFieldValues( m_opts );
        if( !setResult )
            return BasicResult<std::optional<Cmd>>( setResult );
        return result;
    }

} // namespace detail
} // namespace cliargs

#endif // CLIARGS_CMD_HPP_INCLUDED
