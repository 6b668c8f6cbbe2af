#pragma once
#include "utils/common.hpp"

#include <map>
#include <stdexcept>
#include <string>

#define REGISTER_COMMAND(klass)                 \
    klass klass::instance(true);                \
    extern "C" void force_link_##klass() {}     // Define function to force linker to keep TU

// for declaring friends like "friend class CmdTestBase<ParseCommand>"
template<typename T> class CmdTestBase;

// a testshell subcommand; not to be confused with Shell::Command, the parsed grammar value
class Command {
    public:
        virtual int run() = 0;
        virtual ~Command() {}

        static std::map<std::string, Command*>& registry() {
            static std::map<std::string, Command*> registry;
            return registry;
        }

        // registered subcommand by name, throws if there is none
        static Command& get(const std::string& name) {
            auto it = registry().find(name);
            if( it == registry().end() ){
                throw std::runtime_error("Unknown command: " + name);
            }
            return *it->second;
        }

        const std::string& name() const {
            return m_name;
        }

        argparse::ArgumentParser& parser() {
            return m_parser;
        }

    protected:
        Command(bool reg, const char* name, const char* description)
            : m_name(name), m_parser(name, "", argparse::default_arguments::help) {
            m_parser.add_description(description);
            register_common_args(m_parser);
            if( reg ){
                if( registry().count(m_name) ){
                    throw std::runtime_error("Command already registered: " + m_name);
                }
                registry()[m_name] = this;
            }
        }

        std::string m_name;
        argparse::ArgumentParser m_parser;
};
