#ifndef METALOADER_METALOADER_HPP
#define METALOADER_METALOADER_HPP

#include <metaloader/version.hpp>
#include <metaloader/context.hpp>
#include <metaloader/errors.hpp>
#include <metaloader/metalink.hpp>
#include <metaloader/metalink_parser.hpp>
#include <metaloader/download_plan.hpp>
#include <metaloader/downloader.hpp>
#include <metaloader/result.hpp>
#include <metaloader/run_context.hpp>

#endif
