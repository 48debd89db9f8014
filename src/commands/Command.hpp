#pragma once
#include "utils/common.hpp"

#include <map>
#include <string>

#define REGISTER_COMMAND(klass)                 \
    klass klass::instance(true);                \
    extern "C" void force_link_##klass() {}     // Define function to force linker to keep TU

// for declaring friends like "friend class CmdTestBase<ReadCommand>"
template<typename T> class CmdTestBase;

class Command {
    public:
        virtual int run() = 0;
        virtual ~Command() {}

        static std::map<std::string, Command*>& registry() {
            static std::map<std::string, Command*> registry;
            return registry;
        }

        // alternative command name => registered name
        static std::map<std::string, std::string>& aliases() {
            static std::map<std::string, std::string> aliases;
            return aliases;
        }

        argparse::ArgumentParser& parser() {
            return m_parser;
        }

        // run() with every error logged and turned into its ExitCode
        static int run_checked(Command* cmd);

    protected:
        Command(bool reg, const char* name, const char* description, const char* alias = nullptr)
            : m_parser(name, "", argparse::default_arguments::help)
        {
            m_parser.add_description(description);
            register_common_args(m_parser);
            if( reg ){
                if( registry().find(name) != registry().end() ){
                    throw std::runtime_error("Command already registered: " + std::string(name));
                }
                registry()[name] = this;
                if( alias ){
                    aliases()[alias] = name;
                }
            }
        }

        // --log given after the subcommand name
        void init_cmd_log() {
            init_log(m_parser.is_used("--log") ? m_parser.get<std::string>("--log") : std::string());
        }

        // writes a window to stdout, either verbatim or followed by a newline
        static void print_window(const buf_t& buf, bool raw);

        argparse::ArgumentParser m_parser;
};
