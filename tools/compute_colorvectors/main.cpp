/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <QDateTime>
#include <QTime>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <queue>
#include <stdexcept>

#include <boost/bind.hpp>
#include <boost/thread.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <io/cmdline.hpp>
#include <io/imagelist.hpp>
#include <io/property_writer.hpp>
#include <util/progress.hpp>
#include <util/types.hpp>
#include <util/errors.hpp>
#include <pipeline/pipeline.hpp>
#include <pipeline/batch_runner.hpp>
#include <store/vector_store.hpp>
#include <store/vector_object.hpp>


using namespace w2cv;

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_interrupt(int)
{
    interrupted = 1;
}

const char* image_filters[] = { "*.jpg", "*.jpeg", "*.png", "*.bmp", "*.JPG", "*.JPEG", "*.PNG", "*.BMP" };

} // anonymous namespace

void progress_observer(BatchRunner& runner)
{
    size_t lastindex = 0;
    int running_sum_time = 0;
    int running_sum_processed = 0;

    QTime lasttime;
    std::queue<pair<int,int> > queue;

    // average over the last q_maxsize intervals such that
    // outliers do not strongly influence the estimate
    std::size_t q_maxsize = 100;

    bool firstrun = true;
    int ticks = 0;
    while (!runner.finished())
    {
        if (interrupted && !runner.cancelled())
        {
            std::cout << std::endl << "compute_colorvectors: interrupted, finishing images in flight" << std::endl;
            runner.cancel();
        }

        // poll often for interrupts, print every 3 seconds
        if (ticks++ % 30 != 0)
        {
            boost::this_thread::sleep(boost::posix_time::milliseconds(100));
            continue;
        }

        size_t index = runner.current();
        int d_processed = index - lastindex;

        if (!firstrun && d_processed > 0)
        {
            int d_time = lasttime.elapsed();

            queue.push(std::make_pair(d_time, d_processed));
            running_sum_time += d_time;
            running_sum_processed += d_processed;

            if (queue.size() > q_maxsize)
            {
                running_sum_time -= queue.front().first;
                running_sum_processed -= queue.front().second;
                queue.pop();
            }
        }

        std::cout << "compute: " << index << "/" << runner.num_jobs() << ", failed: " << runner.num_failed();
        if (queue.size() > 0 && running_sum_processed > 0)
        {
            int msecimage = running_sum_time / static_cast<float>(running_sum_processed);
            int etaseconds = (runner.num_jobs() - index) * msecimage / 1000;
            int fmth = etaseconds / 3600;
            int fmtm = etaseconds / 60 % 60;
            int fmts = etaseconds % 60;
            std::cout << ", ms/image: " << msecimage << ", eta: " << fmth << ":" << fmtm << ":" << fmts;
        }

        std::cout << "            \r" << std::flush;

        lasttime.start();
        firstrun = false;
        lastindex = index;

        boost::this_thread::sleep(boost::posix_time::milliseconds(100));
    }

    std::cout << std::endl;
}

void print_parameters(const ptree& params, const string& prefix = "")
{
    const int c0 = 30;
    for (ptree::const_iterator it = params.begin(); it != params.end(); ++it)
    {
        string name = prefix.empty() ? it->first : prefix + "." + it->first;
        if (!it->second.empty())
        {
            print_parameters(it->second, name);
            continue;
        }

        std::cout << name;
        for (int i = 0; i < c0 - int(name.length()); i++) std::cout << ' ';
        std::cout << it->second.data() << std::endl;
    }
}

/// Loads filelist if given, otherwise scans rootdir for images
bool load_image_list(ImageList& images, const string& rootdir, const string& filelist)
{
    try { images.set_root_dir(rootdir); }
    catch (const std::exception& e)
    {
        std::cerr << "compute_colorvectors: " << e.what() << std::endl;
        return false;
    }

    if (!filelist.empty())
    {
        try { images.load(filelist); }
        catch (const std::exception& e)
        {
            std::cerr << "compute_colorvectors: failed to load filelist from file " << filelist << ": " << e.what() << std::endl;
            return false;
        }
    }
    else
    {
        progress_output progress(100);
        vector<string> filters(image_filters, image_filters + sizeof(image_filters) / sizeof(image_filters[0]));
        images.lookup_dir(filters, boost::bind<void>(progress, boost::arg<1>(), "compute_colorvectors: scanning: "));
        std::cout << std::endl;
    }

    return true;
}

class command_compute : public Command
{
public:

    command_compute()
        : Command("compute [options]")
        , _co_rootdir   ("rootdir"   , "r", "root directory of the images, one subdirectory per word [required]")
        , _co_filelist  ("filelist"  , "f", "file that contains image filenames relative to rootdir [optional] (default: all images below rootdir)")
        , _co_output    ("output"    , "o", "output vector store [required]")
        , _co_params    ("parameters", "p", "parameters as key=value pairs [optional] (see 'info' for defaults)")
        , _co_paramfile ("paramfile" , "j", "JSON file holding parameters, --parameters take precedence [optional]")
        , _co_numthreads("numthreads", "t", "number of threads for parallel computation [optional] (default: number of processors)")
        , _co_word      ("word"      , "w", "label all images with this word [optional] (default: first directory below rootdir)")
        , _co_colorgrams("colorgrams", "c", "also write the colorgram of every image to this property file [optional]")
        , _co_append    ("append"    , "a", "existing vector store the results are added to [optional]")
    {
        add(_co_rootdir);
        add(_co_filelist);
        add(_co_output);
        add(_co_params);
        add(_co_paramfile);
        add(_co_numthreads);
        add(_co_word);
        add(_co_colorgrams);
        add(_co_append);
    }

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        string in_rootdir;
        string in_output;
        if (!_co_rootdir.parse_single<string>(args, in_rootdir)
                || !_co_output.parse_single<string>(args, in_output))
        {
            print();
            return false;
        }

        // ----------------------------------------------------------------------------------
        // parameters: JSON file first, command line on top
        ptree params;

        string in_paramfile;
        if (_co_paramfile.parse_single<string>(args, in_paramfile))
        {
            try { boost::property_tree::read_json(in_paramfile, params); }
            catch (const std::exception& e)
            {
                std::cerr << "compute_colorvectors: cannot read parameter file " << in_paramfile << ": " << e.what() << std::endl;
                return false;
            }
        }

        vector<string> in_params;
        _co_params.parse_multiple<string>(args, in_params);
        try { put_parameters(params, in_params); }
        catch (const std::exception& e)
        {
            std::cerr << "compute_colorvectors: " << e.what() << std::endl;
            return false;
        }

        // ----------------------------------------------------------------------------------
        // number of threads to be used: by default we use as many
        // as we have processors on the machine, otherwise use
        // user-provided parameter.
        int in_numthreads = parse<int>(params, "pipeline.threads", boost::thread::hardware_concurrency());
        if (_co_numthreads.parse_single<int>(args, in_numthreads))
        {
            params.put("pipeline.threads", in_numthreads);
        }
        if (in_numthreads < 1)
        {
            std::cout << "compute_colorvectors: number of threads should be > 0, using default" << std::endl;
            in_numthreads = std::max(1u, boost::thread::hardware_concurrency());
            params.put("pipeline.threads", in_numthreads);
        }
        std::cout << "compute_colorvectors: using " << in_numthreads << " threads" << std::endl;

        // ----------------------------------------------------------------------------------
        // resources and pipeline, any failure here is fatal
        shared_ptr<Pipeline> pipeline;
        try
        {
            PipelineResources resources = load_resources(params);
            pipeline = make_shared<Pipeline>(params, resources);
        }
        catch (const std::exception& e)
        {
            std::cerr << "compute_colorvectors: " << e.what() << std::endl;
            return false;
        }

        string in_filelist;
        _co_filelist.parse_single<string>(args, in_filelist);

        ImageList images;
        if (!load_image_list(images, in_rootdir, in_filelist)) return false;

        string in_word;
        if (_co_word.parse_single<string>(args, in_word)) images.set_word(in_word);

        std::cout << "compute_colorvectors: " << images.size() << " images, "
                  << images.words().size() << " words, revision " << pipeline->revision() << std::endl;

        vector<ImageJob> jobs;
        for (size_t i = 0; i < images.size(); i++)
        {
            jobs.push_back(make_file_job(images.get_filename(i), images.image_id(i), images.word(i)));
        }

        VectorStore store;
        string in_append;
        if (_co_append.parse_single<string>(args, in_append))
        {
            try { store.import_from(in_append); }
            catch (const std::exception& e)
            {
                std::cerr << "compute_colorvectors: " << e.what() << std::endl;
                return false;
            }

            // all vectors of a revision share one length, compare against the first word vector
            vector<string> words = store.list_words(pipeline->revision());
            optional<WordVector> existing;
            if (!words.empty()) existing = store.get(words.front(), pipeline->revision());
            if (existing && existing->mean().size() != pipeline->feature_length())
            {
                std::cerr << "compute_colorvectors: " << in_append << " holds vectors of length " << existing->mean().size()
                          << " in revision " << pipeline->revision() << ", the parameters give length "
                          << pipeline->feature_length() << std::endl;
                return false;
            }
        }
        store.set_meta("rootdir", in_rootdir);
        store.set_meta("revision", pipeline->revision());

        BatchRunner runner(*pipeline, jobs, store);

        shared_ptr<PropertyWriterT<Colorgram> > colorgram_writer;
        string in_colorgrams;
        if (_co_colorgrams.parse_single<string>(args, in_colorgrams))
        {
            try
            {
                colorgram_writer = make_shared<PropertyWriterT<Colorgram> >(in_colorgrams);
                colorgram_writer->set_entry("revision", pipeline->revision());
            }
            catch (const std::exception& e)
            {
                // fail now instead of doing a long computation for which we cannot store the result
                std::cerr << "compute_colorvectors: failed to open colorgram file " << in_colorgrams << ": " << e.what() << std::endl;
                return false;
            }
            runner.add_colorgram_writer(colorgram_writer);
        }

        // ----------------------------------------------------------------------------------
        // start computing
        std::signal(SIGINT, on_interrupt);

        QDateTime time = QDateTime::currentDateTime();

        boost::thread obs(progress_observer, boost::ref(runner));

        bool okay = runner.start(in_numthreads);

        int seconds = time.secsTo(QDateTime::currentDateTime());
        obs.join();

        std::signal(SIGINT, SIG_DFL);

        int fmth = seconds / 3600;
        int fmtm = seconds / 60 % 60;
        int fmts = seconds % 60;
        std::cout << (runner.cancelled() ? "cancelled." : "finished.") << std::endl;
        std::cout << "duration: " << fmth << "h " << fmtm << "m " << fmts << "s" << " (" << seconds << " s)" << std::endl;

        size_t succeeded = 0;
        for (size_t i = 0; i < runner.results().size(); i++)
        {
            if (runner.results()[i].status == ImageResult::succeeded) succeeded++;
        }
        std::cout << "images: " << succeeded << " succeeded, " << runner.num_failed() << " failed, "
                  << runner.num_jobs() - succeeded - runner.num_failed() << " not processed" << std::endl;

        if (!okay)
        {
            std::cerr << "compute_colorvectors: error during computation occured: " << runner.error() << std::endl;
        }

        // partial results of a cancelled or aborted batch are valid and get stored as well
        try
        {
            if (colorgram_writer) colorgram_writer->close();
            store.export_to(in_output);
            boost::property_tree::write_json(in_output + ".parameters", pipeline->parameters());
        }
        catch (const std::exception& e)
        {
            std::cerr << "compute_colorvectors: " << e.what() << std::endl;
            return false;
        }

        return okay;
    }

private:

    CmdOption _co_rootdir;
    CmdOption _co_filelist;
    CmdOption _co_output;
    CmdOption _co_params;
    CmdOption _co_paramfile;
    CmdOption _co_numthreads;
    CmdOption _co_word;
    CmdOption _co_colorgrams;
    CmdOption _co_append;
};

class command_filelist : public Command
{
public:

    command_filelist()
        : Command("filelist [options]")
        , _co_rootdir("rootdir", "r", "root directory of the images [required]")
        , _co_output ("output" , "o", "output filelist [required]")
        , _co_word   ("word"   , "w", "label all images with this word [optional]")
    {
        add(_co_rootdir);
        add(_co_output);
        add(_co_word);
    }

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        string in_rootdir;
        string in_output;
        if (!_co_rootdir.parse_single<string>(args, in_rootdir)
                || !_co_output.parse_single<string>(args, in_output))
        {
            print();
            return false;
        }

        ImageList images;
        if (!load_image_list(images, in_rootdir, "")) return false;

        string in_word;
        if (_co_word.parse_single<string>(args, in_word)) images.set_word(in_word);

        try { images.store(in_output); }
        catch (const std::exception& e)
        {
            std::cerr << "compute_colorvectors: failed to store filelist: " << e.what() << std::endl;
            return false;
        }

        std::cout << "compute_colorvectors: " << images.size() << " images, " << images.words().size() << " words" << std::endl;
        return true;
    }

private:

    CmdOption _co_rootdir;
    CmdOption _co_output;
    CmdOption _co_word;
};

class command_info : public Command
{
public:

    command_info()
        : Command("info")
    {}

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        std::cout << " parameter                   | default" << std::endl;
        std::cout << "                             +        " << std::endl;
        print_parameters(default_parameters());
        std::cout << "colorgram.range.c{0,1,2}.{min,max}   range of the color table" << std::endl;
        return true;
    }
};


int main(int argc, char *argv[])
{
    command_map_t commands;
    commands["compute"]  = std::make_pair(boost::make_shared<command_compute>(), "compute feature and word vectors of a set of images");
    commands["filelist"] = std::make_pair(boost::make_shared<command_filelist>(), "list all images below a directory");
    commands["info"]     = std::make_pair(boost::make_shared<command_info>(), "print parameters and their defaults");

    return run_command("compute_colorvectors", commands, argc, argv);
}
