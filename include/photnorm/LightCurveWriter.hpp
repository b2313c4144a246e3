#pragma once
#include "Photometry.hpp"
#include "Metadata.hpp"
#include <iosfwd>
#include <string>

namespace photnorm {

/* --------------------------------------------------------------------- */
/*            SNANA-style light-curve files, one per object              */
/* --------------------------------------------------------------------- */
class LightCurveWriter {
public:
    LightCurveWriter(std::string output_dir, std::string survey);

    // <output_dir>/<object>/Photometry/<object>.photometry.snana.dat
    std::string output_path(const std::string& object) const;

    /* writes through a temporary file renamed over the target;
     * std::runtime_error on I/O failure. Returns the path written.         */
    std::string write(const std::string&    object,
                      const ObjectMetadata& meta,
                      const FluxTable&      lc) const;

    void write_snana(std::ostream&         os,
                     const std::string&    object,
                     const ObjectMetadata& meta,
                     const FluxTable&      lc) const;

private:
    std::string output_dir_;
    std::string survey_;
};

} // namespace photnorm
