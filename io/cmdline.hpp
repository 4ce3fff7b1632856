/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef IO__CMDLINE_HPP
#define IO__CMDLINE_HPP

#include <cctype>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ptree.hpp>

namespace w2cv
{

/// \addtogroup io
/// @{

/// -x: a dash followed by a single letter
inline bool is_short_option(const std::string& s)
{
    return s.size() == 2 && s[0] == '-' && std::isalpha(static_cast<unsigned char>(s[1]));
}

/// --name: two dashes followed by a letter and arbitrary characters
inline bool is_long_option(const std::string& s)
{
    return s.size() > 2 && s.compare(0, 2, "--") == 0 && std::isalpha(static_cast<unsigned char>(s[2]));
}

inline bool is_option(const std::string& s)
{
    return is_short_option(s) || is_long_option(s);
}

inline std::vector<std::string> argv_to_strings(int argc, char* argv[])
{
    return std::vector<std::string>(argv, argv + argc);
}

/**
 * @brief Puts parameters given as key=value strings into a property tree.
 *
 * The key is a ptree path, e.g. colorgram.bins=16. A key without '=' is set to
 * the empty string.
 *
 * @throws std::invalid_argument if a parameter has an empty key or more than one '='
 */
inline void put_parameters(boost::property_tree::ptree& params, const std::vector<std::string>& key_values)
{
    for (size_t i = 0; i < key_values.size(); i++)
    {
        std::vector<std::string> pv;
        boost::algorithm::split(pv, key_values[i], boost::algorithm::is_any_of("="));

        if ((pv.size() != 1 && pv.size() != 2) || pv[0].empty())
        {
            throw std::invalid_argument("cannot parse parameter: " + key_values[i]);
        }
        params.put(pv[0], (pv.size() == 2) ? pv[1] : "");
    }
}

/**
 * @brief A named option of a Command, e.g. --numthreads 8 or -t 8.
 *
 * Every option takes one or more values: all arguments following the option up to
 * the next option. Values that cannot be converted to the requested type are
 * reported on std::cerr and skipped.
 */
class CmdOption
{
    public:

    CmdOption(const std::string& long_name, const std::string& short_name, const std::string& description)
        : _long_name(long_name)
        , _short_name(short_name)
        , _description(description)
    {}

    bool matches(const std::string& arg) const
    {
        if (is_long_option(arg)) return arg.compare(2, std::string::npos, _long_name) == 0;
        if (is_short_option(arg)) return arg.compare(1, std::string::npos, _short_name) == 0;
        return false;
    }

    /// First value of the last occurrence of the option, false if there is none
    template <class T>
    bool parse_single(const std::vector<std::string>& args, T& value) const
    {
        std::vector<T> values;
        bool found = false;
        for (size_t i = 0; i < args.size(); i++)
        {
            if (!matches(args[i])) continue;

            values.clear();
            if (convert_values(args, i + 1, 1, values))
            {
                value = values.front();
                found = true;
            }
        }
        return found;
    }

    /// All values of all occurrences of the option, appended to values
    template <class T>
    bool parse_multiple(const std::vector<std::string>& args, std::vector<T>& values) const
    {
        bool found = false;
        for (size_t i = 0; i < args.size(); i++)
        {
            if (matches(args[i]) && convert_values(args, i + 1, args.size(), values)) found = true;
        }
        return found;
    }

    const std::string& long_name() const { return _long_name; }
    const std::string& short_name() const { return _short_name; }
    const std::string& description() const { return _description; }

    private:

    template <class T>
    bool convert_values(const std::vector<std::string>& args, size_t first, size_t max_count, std::vector<T>& values) const
    {
        size_t n = values.size();
        for (size_t k = first; k < args.size() && k - first < max_count && !is_option(args[k]); k++)
        {
            try
            {
                values.push_back(boost::lexical_cast<T>(args[k]));
            }
            catch (const boost::bad_lexical_cast&)
            {
                std::cerr << "--" << _long_name << ": cannot use value '" << args[k] << "'" << std::endl;
            }
        }
        return values.size() > n;
    }

    std::string _long_name;
    std::string _short_name;
    std::string _description;
};


/**
 * @brief A subcommand of one of our tools, e.g. 'compute' in 'compute_colorvectors compute ...'.
 *
 * Derived classes register their options in the constructor and implement run().
 */
class Command
{
    public:

    explicit Command(const std::string& usage = "") : _usage(usage)
    {}

    virtual ~Command() {}

    void add(const CmdOption& option)
    {
        _options.push_back(option);
    }

    /// Prints a warning for every option that has not been registered with add()
    void warn_for_unknown_option(const std::vector<std::string>& args) const
    {
        for (size_t i = 0; i < args.size(); i++)
        {
            if (is_option(args[i]) && !known(args[i]))
            {
                std::cerr << "WARNING: unknown option: " << args[i] << std::endl;
            }
        }
    }

    /// Arguments that are neither options nor values of a registered option
    std::vector<std::string> positional(const std::vector<std::string>& args) const
    {
        std::vector<std::string> result;
        bool in_values = false;
        for (size_t i = 0; i < args.size(); i++)
        {
            if (is_option(args[i])) in_values = known(args[i]);
            else if (!in_values) result.push_back(args[i]);
        }
        return result;
    }

    /// Usage line followed by one line per option
    void print() const
    {
        const size_t c0 = 30;

        std::cout << _usage << std::endl;
        if (!_options.empty()) std::cout << "options:" << std::endl;

        for (size_t i = 0; i < _options.size(); i++)
        {
            std::string line = "  --" + _options[i].long_name() + ", -" + _options[i].short_name();
            if (line.size() < c0) line.resize(c0, ' ');
            std::cout << line << _options[i].description() << std::endl;
        }
    }

    virtual bool run(const std::vector<std::string>& args) = 0;

    private:

    bool known(const std::string& arg) const
    {
        for (size_t k = 0; k < _options.size(); k++)
        {
            if (_options[k].matches(arg)) return true;
        }
        return false;
    }

    std::vector<CmdOption> _options;
    std::string            _usage;
};


/// name -> (command, one-line description)
typedef std::map<std::string, std::pair<boost::shared_ptr<Command>, std::string> > command_map_t;

/**
 * @brief Entry point of our tools: runs the command named by argv[1] on the remaining arguments.
 *
 * Prints the list of commands if argv[1] is missing or unknown.
 *
 * @return exit code, 0 if the command succeeded
 */
inline int run_command(const std::string& tool, const command_map_t& commands, int argc, char* argv[])
{
    command_map_t::const_iterator cmd = (argc > 1) ? commands.find(argv[1]) : commands.end();
    if (cmd != commands.end())
    {
        return cmd->second.first->run(argv_to_strings(argc - 2, argv + 2)) ? 0 : 1;
    }

    const size_t c0 = 20;
    std::cout << "usage: " << tool << " <command> ..." << std::endl;
    std::cout << " commands:" << std::endl;
    for (cmd = commands.begin(); cmd != commands.end(); ++cmd)
    {
        std::string name = cmd->first;
        if (name.size() < c0) name.resize(c0, ' ');
        std::cout << " * " << name << " : " << cmd->second.second << std::endl;
    }
    return 1;
}

/// @} // end addtogroup

} // namespace w2cv

#endif // IO__CMDLINE_HPP
