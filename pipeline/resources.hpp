/*
Copyright (C) 2012 Mathias Eitz and Ronald Richter.
All rights reserved.

This file is part of the w2cv library and is made available under
the terms of the BSD license (see the LICENSE file).
*/

#ifndef PIPELINE__RESOURCES_HPP
#define PIPELINE__RESOURCES_HPP

#include "../util/types.hpp"
#include "../color/color_table.hpp"
#include "../descriptors/linear_transform.hpp"

namespace w2cv {

/**
 * @ingroup pipeline
 * @brief Read-only data shared by all images of a computation.
 *
 * Loaded once before any image is processed and then shared between all worker
 * threads. transform is null if no transform is configured.
 */
struct PipelineResources
{
    shared_ptr<const ColorTable>      color_table;
    shared_ptr<const LinearTransform> transform;
};

/**
 * @brief Loads the resources named in params.
 *
 * Reads resources.color_table (required) and features.transform (optional).
 *
 * @throws MissingColorTable if no color table is configured or it cannot be loaded
 * @throws MissingTransform if a transform is configured but cannot be loaded
 */
PipelineResources load_resources(ptree& params);

/**
 * @brief Documented defaults of all pipeline parameters.
 *
 * The histogram ranges (colorgram.range.*) are missing since they default to the
 * range of the color table in use.
 */
ptree default_parameters();

} // namespace w2cv

#endif // PIPELINE__RESOURCES_HPP
