/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#include <algorithm>

#include <boost/thread/thread.hpp>

#include "resources.hpp"
#include "../util/errors.hpp"

namespace w2cv {

PipelineResources load_resources(ptree& params)
{
    PipelineResources resources;

    string table_file = parse<string>(params, "resources.color_table", "");
    if (table_file.empty()) throw MissingColorTable("no color table configured (resources.color_table)");
    resources.color_table = LookupColorTable::load(table_file);

    string transform_file = parse<string>(params, "features.transform", "");
    if (!transform_file.empty()) resources.transform = LinearTransform::load(transform_file);

    return resources;
}

ptree default_parameters()
{
    ptree p;
    p.put("colorgram.bins", 8);
    p.put("colorgram.levels", 1);
    p.put("colorgram.grid", 2);
    p.put("colorgram.mode", "marginal");
    p.put("features.histogram", true);
    p.put("features.moments", true);
    p.put("features.wavelet_levels", 0);
    p.put("features.transform", "");
    p.put("resources.color_table", "");
    p.put("store.revision", "unnamed-revision");
    p.put("pipeline.threads", std::max(1u, boost::thread::hardware_concurrency()));
    return p;
}

} // namespace w2cv
