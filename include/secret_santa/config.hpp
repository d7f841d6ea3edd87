#pragma once

#include <secret_santa/model.hpp>

#include <iosfwd>
#include <string>

namespace secret_santa
{

// JSON in the layout of sample_model(). Only "people" is required.
// Parse errors are thrown as configuration_error.
constraint_model read_model(std::istream& stream);
constraint_model read_model_file(std::string const& file_name);

void write_model(std::ostream& stream, constraint_model const& model);

// Writes the assignments as a history record, ready to paste into next
// year's "history". Boost.PropertyTree writes every value as a JSON string,
// so "year" and "exclude_pairs" come out as "2025" and "true"; read_model
// accepts both forms, other JSON consumers see strings.
void write_assignments(std::ostream& stream, assignments const& assignments, int year);

constraint_model sample_model();

}
