/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <QDateTime>

#include <iostream>
#include <stdexcept>

#include <util/types.hpp>
#include <io/cmdline.hpp>
#include <color/color_table.hpp>


// ------------------------------------------------------------
// General usage
//
//    generate_color_table -o jzazbz.table [-c jzazbz|lab] [-l 100]
//
// Computes the perceptual coordinates of all 256^3 sRGB colors
// and writes them as the lookup table used by compute_colorvectors
// (parameter resources.color_table). The table takes 192MB.
// ------------------------------------------------------------

using namespace w2cv;

class command_generate : public Command
{
public:

    command_generate()
        : Command("generate_color_table [options]")
        , _co_output    ("output"    , "o", "output filename [required]")
        , _co_colorspace("colorspace", "c", "target colorspace, jzazbz or lab [optional] (default: jzazbz)")
        , _co_luminance ("luminance" , "l", "luminance of sRGB white in cd/m^2, jzazbz only [optional] (default: 100)")
    {
        add(_co_output);
        add(_co_colorspace);
        add(_co_luminance);
    }

    bool run(const std::vector<std::string>& args)
    {
        warn_for_unknown_option(args);

        string in_output;
        if (!_co_output.parse_single<string>(args, in_output))
        {
            print();
            return false;
        }

        string in_colorspace = "jzazbz";
        _co_colorspace.parse_single<string>(args, in_colorspace);

        double in_luminance = 100.0;
        _co_luminance.parse_single<double>(args, in_luminance);
        if (!(in_luminance > 0.0))
        {
            std::cerr << "generate_color_table: luminance must be > 0" << std::endl;
            return false;
        }

        std::cout << "generate_color_table: computing " << in_colorspace << " table";
        if (in_colorspace == "jzazbz") std::cout << " (white: " << in_luminance << " cd/m^2)";
        std::cout << std::endl;

        QDateTime time = QDateTime::currentDateTime();

        try
        {
            shared_ptr<LookupColorTable> table = LookupColorTable::generate(in_colorspace, in_luminance);
            table->save(in_output);

            std::cout << "channel ranges:" << std::endl;
            for (int c = 0; c < 3; c++)
            {
                std::cout << "  c" << c << ": [" << table->channel_min(c) << ", " << table->channel_max(c) << "]" << std::endl;
            }
        }
        catch (const std::exception& e)
        {
            std::cerr << "generate_color_table: " << e.what() << std::endl;
            return false;
        }

        std::cout << "finished, duration: " << time.secsTo(QDateTime::currentDateTime()) << " s" << std::endl;
        return true;
    }

private:

    CmdOption _co_output;
    CmdOption _co_colorspace;
    CmdOption _co_luminance;
};


int main(int argc, char *argv[])
{
    command_generate cmd;
    return cmd.run(argv_to_strings(argc - 1, &argv[1])) ? 0 : 1;
}
