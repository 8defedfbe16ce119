#include "SchemeRenamer.h"

#include <string>
#include <vector>

// Short function words kept lower-case by title casing unless they open or close the name
const std::vector<std::string> SchemeRenamer::TitleCaseSmallWords = {
	"a", "an", "the", "and", "but", "or", "for", "nor", "as", "at", "by",
	"from", "in", "into", "near", "of", "on", "onto", "to", "with"};
