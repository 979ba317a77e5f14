
#ifndef METALOADER_API_HPP
#define METALOADER_API_HPP


#ifdef METALOADER_STATIC
// As a static library: no symbol import/export.
#  define METALOADER_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef METALOADER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define METALOADER_API __declspec(dllexport)
#    else
#         define METALOADER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define METALOADER_API __declspec(dllimport)
#    else
#         define METALOADER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
