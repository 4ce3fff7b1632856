/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <fstream>
#include <iostream>
#include <stdexcept>

#include <util/types.hpp>
#include <util/progress.hpp>
#include <io/cmdline.hpp>
#include <store/vector_store.hpp>


// ------------------------------------------------------------
// General usage
//
//    colorstore list <store>
//    colorstore show <store> <word> [-r revision]
//    colorstore merge <output> <store> <store> ...
//    colorstore merge_revision <store> <source> <target>
//    colorstore finalize <store> <revision>
//    colorstore json <store> [-o output]
//
// Commands that change a store write it back in place.
// ------------------------------------------------------------

using namespace w2cv;

bool load_store(VectorStore& store, const string& filename)
{
    try { store.import_from(filename); }
    catch (const std::exception& e)
    {
        std::cerr << "colorstore: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool save_store(const VectorStore& store, const string& filename)
{
    try { store.export_to(filename); }
    catch (const std::exception& e)
    {
        std::cerr << "colorstore: " << e.what() << std::endl;
        return false;
    }
    return true;
}

template <class T>
void print_vector(const string& name, const std::vector<T>& v)
{
    std::cout << "  " << name << ": [";
    for (size_t i = 0; i < v.size(); i++) std::cout << (i ? ", " : "") << v[i];
    std::cout << "]" << std::endl;
}

class command_list : public Command
{
public:

    command_list() : Command("list <store>") {}

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        std::vector<std::string> in = positional(args);
        if (in.size() != 1)
        {
            print();
            return false;
        }

        VectorStore store;
        if (!load_store(store, in[0])) return false;

        strmap_t meta = store.meta();
        for (strmap_t::const_iterator it = meta.begin(); it != meta.end(); ++it)
        {
            std::cout << it->first << ": " << it->second << std::endl;
        }

        std::cout << store.num_word_vectors() << " word vectors, "
                  << store.num_feature_vectors() << " feature vectors" << std::endl;

        vector<string> revisions = store.list_revisions();
        for (size_t r = 0; r < revisions.size(); r++)
        {
            std::cout << "revision " << revisions[r] << (store.is_finalized(revisions[r]) ? " (finalized)" : "") << std::endl;

            vector<string> words = store.list_words(revisions[r]);
            for (size_t w = 0; w < words.size(); w++)
            {
                optional<WordVector> v = store.get(words[w], revisions[r]);
                if (!v) continue;
                std::cout << "  " << words[w] << ": " << v->count() << " images, length " << v->mean().size() << std::endl;
            }
        }

        return true;
    }
};

class command_show : public Command
{
public:

    command_show()
        : Command("show <store> <word> [options]")
        , _co_revision("revision", "r", "show this revision only [optional] (default: all revisions)")
    {
        add(_co_revision);
    }

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        std::vector<std::string> in = positional(args);
        if (in.size() != 2)
        {
            print();
            return false;
        }

        VectorStore store;
        if (!load_store(store, in[0])) return false;

        vector<string> revisions;
        string in_revision;
        if (_co_revision.parse_single<string>(args, in_revision)) revisions.push_back(in_revision);
        else revisions = store.list_revisions();

        bool found = false;
        for (size_t r = 0; r < revisions.size(); r++)
        {
            optional<WordVector> v = store.get(in[1], revisions[r]);
            if (!v) continue;

            found = true;
            std::cout << v->word << " (" << v->revision << "), " << v->count() << " images" << std::endl;
            print_vector("mean", v->mean());
            print_vector("variance", v->variance());
        }

        if (!found)
        {
            std::cerr << "colorstore: no word vector for " << in[1] << std::endl;
            return false;
        }
        return true;
    }

private:

    CmdOption _co_revision;
};

class command_merge : public Command
{
public:

    command_merge() : Command("merge <output> <store> <store> ...") {}

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        std::vector<std::string> in = positional(args);
        if (in.size() < 2)
        {
            print();
            return false;
        }

        VectorStore merged;
        progress_output progress(1);
        for (size_t i = 1; i < in.size(); i++)
        {
            VectorStore store;
            if (!load_store(store, in[i])) return false;

            try { merged.merge_store(store); }
            catch (const std::exception& e)
            {
                std::cerr << std::endl << "colorstore: cannot merge " << in[i] << ": " << e.what() << std::endl;
                return false;
            }
            progress(i - 1, in.size() - 1, "colorstore: merging: ");
        }

        return save_store(merged, in[0]);
    }
};

class command_merge_revision : public Command
{
public:

    command_merge_revision() : Command("merge_revision <store> <source> <target>") {}

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        std::vector<std::string> in = positional(args);
        if (in.size() != 3)
        {
            print();
            return false;
        }

        VectorStore store;
        if (!load_store(store, in[0])) return false;

        try
        {
            size_t n = store.merge_revision(in[1], in[2]);
            std::cout << "colorstore: merged " << n << " word vectors from " << in[1] << " into " << in[2] << std::endl;
        }
        catch (const std::exception& e)
        {
            std::cerr << "colorstore: " << e.what() << std::endl;
            return false;
        }

        return save_store(store, in[0]);
    }
};

class command_finalize : public Command
{
public:

    command_finalize() : Command("finalize <store> <revision>") {}

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        std::vector<std::string> in = positional(args);
        if (in.size() != 2)
        {
            print();
            return false;
        }

        VectorStore store;
        if (!load_store(store, in[0])) return false;

        store.finalize(in[1]);
        return save_store(store, in[0]);
    }
};

class command_json : public Command
{
public:

    command_json()
        : Command("json <store> [options]")
        , _co_output("output", "o", "output filename [optional] (default: console)")
    {
        add(_co_output);
    }

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        std::vector<std::string> in = positional(args);
        if (in.size() != 1)
        {
            print();
            return false;
        }

        VectorStore store;
        if (!load_store(store, in[0])) return false;

        string in_output;
        if (!_co_output.parse_single<string>(args, in_output))
        {
            store.export_json(std::cout);
            return true;
        }

        std::ofstream ofs(in_output.c_str());
        if (!ofs.is_open())
        {
            std::cerr << "colorstore: could not open file " << in_output << std::endl;
            return false;
        }

        store.export_json(ofs);
        ofs.close();
        if (!ofs)
        {
            std::cerr << "colorstore: failed writing " << in_output << std::endl;
            return false;
        }
        return true;
    }

private:

    CmdOption _co_output;
};


int main(int argc, char *argv[])
{
    command_map_t commands;
    commands["list"]           = std::make_pair(boost::make_shared<command_list>(), "list revisions and words of a store");
    commands["show"]           = std::make_pair(boost::make_shared<command_show>(), "print the word vector of a word");
    commands["merge"]          = std::make_pair(boost::make_shared<command_merge>(), "merge several stores into one");
    commands["merge_revision"] = std::make_pair(boost::make_shared<command_merge_revision>(), "merge one revision into another");
    commands["finalize"]       = std::make_pair(boost::make_shared<command_finalize>(), "make a revision immutable");
    commands["json"]           = std::make_pair(boost::make_shared<command_json>(), "dump a store as JSON");

    return run_command("colorstore", commands, argc, argv);
}
