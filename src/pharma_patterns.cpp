#include "pharma_patterns.hpp"

#include "text_utils.hpp"

#include <map>
#include <stdexcept>

const char* const kPatternLibraryVersion = "2.0";

namespace {

struct CategoryEntry {
  PatternCategory category;
  const char* name;
  bool caseSensitive;
  std::vector<std::string> patterns;
};

const std::vector<CategoryEntry>& catalogue() {
  static const std::vector<CategoryEntry> entries = {
    {PatternCategory::Company, "company", false, {
      // Major Indian manufacturers
      R"(sun\s+pharma(?:ceuticals)?)",
      R"(dr\.?\s*reddy['s]*\s*(?:lab|laboratories)?)",
      R"(cipla\s*(?:ltd|limited)?)",
      R"(lupin\s*(?:ltd|limited)?)",
      R"(aurobindo\s+pharma)",
      R"(divi['s]*\s*(?:lab|laboratories))",
      R"(biocon\s*(?:ltd|limited)?)",
      R"(cadila\s+(?:healthcare|pharma))",
      R"(torrent\s+(?:pharma|pharmaceuticals))",
      R"(glenmark\s+(?:pharma|pharmaceuticals))",
      R"(alkem\s+(?:lab|laboratories))",
      R"(abbott\s+(?:india|healthcare))",
      R"(pfizer\s*(?:ltd|limited)?)",
      R"(novartis\s*(?:india)?)",
      R"(gsk\s*(?:pharma|pharmaceuticals)?)",
      R"(sanofi\s*(?:india|aventis)?)",
      R"(mankind\s+pharma)",
      R"(emcure\s+(?:pharma|pharmaceuticals))",
      R"(intas\s+(?:pharma|pharmaceuticals))",
      R"(zydus\s+(?:cadila|healthcare))",
      // Generic company shapes
      R"(\w+\s+(?:pharma|pharmaceuticals|healthcare|labs?|laboratories))",
      R"(\w+\s+(?:life\s+sciences|biotech|medicines))",
      R"((?:pharma|bio|medi)\w*\s+(?:ltd|limited|pvt|private))",
    }},
    {PatternCategory::DrugName, "drug_name", false, {
      R"((?:paracetamol|acetaminophen)\s*(?:\d+\s*mg)?)",
      R"((?:ibuprofen|brufen)\s*(?:\d+\s*mg)?)",
      R"((?:amoxicillin|augmentin)\s*(?:\d+\s*mg)?)",
      R"((?:azithromycin|zithromax)\s*(?:\d+\s*mg)?)",
      R"((?:metformin|glucophage)\s*(?:\d+\s*mg)?)",
      R"((?:omeprazole|pantoprazole)\s*(?:\d+\s*mg)?)",
      R"((?:amlodipine|norvasc)\s*(?:\d+\s*mg)?)",
      R"((?:atorvastatin|lipitor)\s*(?:\d+\s*mg)?)",
      R"((?:clopidogrel|plavix)\s*(?:\d+\s*mg)?)",
      R"((?:losartan|cozaar)\s*(?:\d+\s*mg)?)",
      // Antibiotic families
      R"((?:ampi|amoxy|cefi|cipro|levo)\w*\s*(?:\d+\s*mg)?)",
      R"(\w*cillin\s*(?:\d+\s*mg)?)",
      R"(\w*mycin\s*(?:\d+\s*mg)?)",
      R"(\w*floxacin\s*(?:\d+\s*mg)?)",
      // Vitamins and supplements
      R"((?:vitamin|vit)\s*[a-z]\d*\s*(?:\d+\s*(?:mg|iu))?)",
      R"((?:calcium|iron|zinc|magnesium)\s*(?:\d+\s*mg)?)",
      R"((?:omega|fish\s+oil)\s*(?:\d+\s*mg)?)",
      R"((?:multivitamin|multi\s+vitamin))",
      // Dosage form or strength after a name
      R"(\w+\s*(?:tablet|tab|capsule|cap|syrup|injection|inj))",
      R"(\w+\s*(?:\d+\s*(?:mg|ml|gm|mcg)))",
    }},
    {PatternCategory::Batch, "batch", false, {
      R"((?:batch|lot)\s*(?:no\.?|number)?\s*:?\s*([A-Z0-9]{3,15}))",
      R"(\b(B\d{6,10})\b)",
      R"(\b(LOT\d{3,8})\b)",
      R"(\b([A-Z]{2}\d{4,8})\b)",
      R"(\b(\d{6}[A-Z]{2,4})\b)",
      R"((?:mfg|manufacturing)\s*(?:no\.?|number)?\s*:?\s*([A-Z0-9]{3,15}))",
    }},
    {PatternCategory::Expiry, "expiry", false, {
      R"((?:exp|expiry|expires?)\s*(?:date)?\s*:?\s*(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}))",
      R"((?:exp|expiry)\s*:?\s*(\d{1,2}\s+\w{3}\s+\d{2,4}))",
      R"((?:valid\s+(?:up\s+)?to|until)\s*:?\s*(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}))",
      R"(\b(exp\s*\d{1,2}[/-]\d{2,4})\b)",
      R"((?:shelf\s+life|use\s+before)\s*:?\s*(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}))",
    }},
    {PatternCategory::ManufacturingDate, "mfg_date", false, {
      R"((?:mfg|manufactured|made)\s*(?:date|on)?\s*:?\s*(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}))",
      R"((?:production|prod)\s*(?:date)?\s*:?\s*(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}))",
      R"((?:dom|date\s+of\s+(?:manufacture|production))\s*:?\s*(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}))",
    }},
    {PatternCategory::Hsn, "hsn", true, {
      R"(\b(3003\d{4})\b)",  // medicaments, unmixed
      R"(\b(3004\d{4})\b)",  // medicaments, packed for retail
      R"(\b(2936\d{4})\b)",  // vitamins
      R"(\b(2937\d{4})\b)",  // hormones
      R"(\b(2939\d{4})\b)",  // alkaloids
      R"(\b(2941\d{4})\b)",  // antibiotics
      R"(\b(1302\d{4})\b)",  // vegetable saps and extracts
      R"(\b(2106\d{4})\b)",  // food preparations
    }},
    {PatternCategory::DrugLicense, "drug_license", false, {
      R"(\b(DL\s*[A-Z]{2}\s*\d{2,6}[A-Z]?)\b)",
      R"(\b([A-Z]{2}[/-]?\d{2}[/-]?\d{4,6}[A-Z]?)\b)",
      R"((?:drug\s+lic(?:ence|ense)?|dl)\s*(?:no\.?|number)?\s*:?\s*([A-Z0-9/-]{5,15}))",
      R"((?:retail|wholesale)\s+drug\s+lic(?:ence|ense)?\s*:?\s*([A-Z0-9/-]{5,15}))",
      // State prefixes
      R"(\b(MH[/-]?\d{2}[/-]?\d{6}[A-Z]?)\b)",
      R"(\b(DL[/-]?\d{2}[/-]?\d{6}[A-Z]?)\b)",
      R"(\b(KA[/-]?\d{2}[/-]?\d{6}[A-Z]?)\b)",
      R"(\b(GJ[/-]?\d{2}[/-]?\d{6}[A-Z]?)\b)",
      R"(\b(TN[/-]?\d{2}[/-]?\d{6}[A-Z]?)\b)",
      R"(\b(UP[/-]?\d{2}[/-]?\d{6}[A-Z]?)\b)",
    }},
    {PatternCategory::PackSize, "pack_size", false, {
      R"((\d+)\s*x\s*(\d+))",
      R"((\d+)\s*(?:strips?|blisters?))",
      R"((\d+)\s*(?:tablets?|caps?|capsules?))",
      R"((\d+)\s*ml\s*(?:bottle|vial))",
      R"((\d+)\s*gm?\s*(?:tube|jar))",
      R"(pack\s+of\s+(\d+))",
      R"(box\s+of\s+(\d+))",
    }},
    {PatternCategory::Strength, "strength", false, {
      R"((\d+(?:\.\d+)?)\s*(mg|mcg|gm?|ml|iu|units?))",
      R"((\d+(?:\.\d+)?)\s*milligrams?)",
      R"((\d+(?:\.\d+)?)\s*micrograms?)",
      R"((\d+(?:\.\d+)?)\s*(?:milli)?liters?)",
      R"((\d+(?:\.\d+)?)\s*(?:international\s+)?units?)",
    }},
    {PatternCategory::Price, "price", false, {
      R"((?:rs\.?|rupees?|₹)\s*(\d{1,3}(?:,\d{3})*(?:\.\d{2})?))",
      R"((\d{1,3}(?:,\d{3})*(?:\.\d{2})?)\s*(?:rs\.?|rupees?|₹))",
      R"((?:mrp|max\.?\s*retail\s*price)\s*:?\s*(?:rs\.?|₹)?\s*(\d{1,3}(?:,\d{3})*(?:\.\d{2})?))",
      R"((?:rate|price|amount)\s*:?\s*(?:rs\.?|₹)?\s*(\d{1,3}(?:,\d{3})*(?:\.\d{2})?))",
    }},
    {PatternCategory::Tax, "tax", false, {
      R"((?:cgst|central\s+gst)\s*@?\s*(\d+(?:\.\d+)?)\s*%)",
      R"((?:sgst|state\s+gst)\s*@?\s*(\d+(?:\.\d+)?)\s*%)",
      R"((?:igst|integrated\s+gst)\s*@?\s*(\d+(?:\.\d+)?)\s*%)",
      R"((?:gst|tax)\s*@?\s*(\d+(?:\.\d+)?)\s*%)",
      R"((?:cgst|sgst|igst)\s*(?:amount)?\s*:?\s*(?:rs\.?|₹)?\s*(\d{1,3}(?:,\d{3})*(?:\.\d{2})?))",
    }},
    {PatternCategory::Discount, "discount", false, {
      R"((?:discount|disc\.?)\s*@?\s*(\d+(?:\.\d+)?)\s*%)",
      R"((?:trade\s+)?discount\s*:?\s*(?:rs\.?|₹)?\s*(\d{1,3}(?:,\d{3})*(?:\.\d{2})?))",
      R"((?:less|minus)\s*:?\s*(?:rs\.?|₹)?\s*(\d{1,3}(?:,\d{3})*(?:\.\d{2})?))",
    }},
    {PatternCategory::Address, "address", false, {
      R"((?:plot|survey)\s+(?:no\.?)?\s*(\d+[a-z]?))",
      R"((?:building|bldg\.?)\s+(?:no\.?)?\s*(\w+))",
      R"((?:floor|flr\.?)\s+(\d+(?:st|nd|rd|th)?))",
      R"(pin\s*(?:code)?\s*:?\s*(\d{6}))",
      R"(\b(\d{6})\b)",
      R"((?:phone|ph\.?|tel\.?|mobile|mob\.?)\s*:?\s*([\d\s\-\+\(\)]{10,15}))",
    }},
    {PatternCategory::Contact, "contact", false, {
      R"((?:phone|ph\.?|tel\.?)\s*:?\s*([\d\s\-\+\(\)]{10,15}))",
      R"((?:mobile|mob\.?|cell)\s*:?\s*([\d\s\-\+\(\)]{10,15}))",
      R"((?:email|e-mail)\s*:?\s*([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}))",
      R"((?:website|web|www)\s*:?\s*((?:www\.)?[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}))",
      R"((?:fax)\s*:?\s*([\d\s\-\+\(\)]{10,15}))",
    }},
    {PatternCategory::InvoiceNumber, "invoice_number", false, {
      R"((?:invoice|bill)\s*(?:no\.?|number|#)\s*:?\s*([A-Z]{2,4}\d{4,8}))",
      R"((?:invoice|bill)\s*(?:no\.?|number|#)\s*:?\s*(INV[A-Z0-9/-]{3,12}))",
      R"((?:invoice|bill)\s*(?:no\.?|number|#)\s*:?\s*([A-Z0-9/-]{5,15}))",
      R"(\b(SI\d{6,10})\b)",  // sales invoice
      R"(\b(PI\d{6,10})\b)",  // purchase invoice
      R"(\b(TI\d{6,10})\b)",  // tax invoice
    }},
  };
  return entries;
}

const CategoryEntry& entryFor(PatternCategory category) {
  for (const auto& entry : catalogue()) {
    if (entry.category == category) return entry;
  }
  throw std::out_of_range("Unknown pattern category");
}

std::regex::flag_type flagsFor(const CategoryEntry& entry) {
  std::regex::flag_type flags = std::regex::ECMAScript | std::regex::optimize;
  if (!entry.caseSensitive) flags |= std::regex::icase;
  return flags;
}

std::vector<PatternMatch> toMatches(const std::vector<std::string>& found, double confidence) {
  std::vector<PatternMatch> out;
  out.reserve(found.size());
  for (const auto& f : found) out.push_back(PatternMatch{f, confidence});
  return out;
}

std::vector<PatternMatch> sweep(PatternCategory category, const std::string& text, double confidence) {
  std::vector<PatternMatch> results;
  for (const auto& re : compiledPatterns(category)) {
    auto matches = toMatches(findAllMatches(re, text), confidence);
    results.insert(results.end(), matches.begin(), matches.end());
  }
  return results;
}

} // namespace

const std::vector<PatternCategory>& allPatternCategories() {
  static const std::vector<PatternCategory> categories = [] {
    std::vector<PatternCategory> out;
    for (const auto& entry : catalogue()) out.push_back(entry.category);
    return out;
  }();
  return categories;
}

const char* categoryName(PatternCategory category) {
  return entryFor(category).name;
}

bool isCaseSensitive(PatternCategory category) {
  return entryFor(category).caseSensitive;
}

const std::vector<std::string>& patternsFor(PatternCategory category) {
  return entryFor(category).patterns;
}

const std::vector<std::regex>& compiledPatterns(PatternCategory category) {
  static const std::map<PatternCategory, std::vector<std::regex>> compiled = [] {
    std::map<PatternCategory, std::vector<std::regex>> out;
    for (const auto& entry : catalogue()) {
      auto& regexes = out[entry.category];
      for (const auto& pattern : entry.patterns) regexes.emplace_back(pattern, flagsFor(entry));
    }
    return out;
  }();
  return compiled.at(category);
}

std::size_t getPatternCount() {
  std::size_t total = 0;
  for (const auto& entry : catalogue()) {
    if (entry.category == PatternCategory::ManufacturingDate) continue;
    total += entry.patterns.size();
  }
  return total;
}

const std::regex& gstinRegex() {
  static const std::regex re(R"(\b[0-3][0-9][A-Z]{5}[0-9]{4}[A-Z][0-9A-Z]Z[0-9A-Z]\b)");
  return re;
}

std::vector<std::string> findAllMatches(const std::regex& re, const std::string& text) {
  std::vector<std::string> found;
  const bool grouped = re.mark_count() > 0;
  for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
    const std::smatch& m = *it;
    std::string value = grouped && m[1].matched ? m[1].str() : m[0].str();
    if (!trim(value).empty()) found.push_back(value);
  }
  return found;
}

std::pair<bool, double> PatternMatcher::isPharmaCompany(const std::string& text) const {
  const auto& patterns = compiledPatterns(PatternCategory::Company);
  int matches = 0;
  for (const auto& re : patterns) {
    if (std::regex_search(text, re)) ++matches;
  }
  double confidence = patterns.empty() ? 0.0 : static_cast<double>(matches) / patterns.size();
  return {matches > 0, confidence};
}

std::vector<PatternMatch> PatternMatcher::extractDrugNames(const std::string& text) const {
  std::vector<PatternMatch> results;
  for (const auto& re : compiledPatterns(PatternCategory::DrugName)) {
    for (const auto& match : findAllMatches(re, text)) {
      std::string lowered = toLower(match);
      bool formulation = false;
      for (const char* kw : {"tablet", "capsule", "mg", "ml"}) {
        if (lowered.find(kw) != std::string::npos) formulation = true;
      }
      results.push_back(PatternMatch{match, formulation ? 0.7 : 0.5});
    }
  }
  return results;
}

std::vector<PatternMatch> PatternMatcher::extractBatchNumbers(const std::string& text) const {
  std::string lowered = toLower(text);
  bool labelled = lowered.find("batch") != std::string::npos || lowered.find("lot") != std::string::npos;
  return sweep(PatternCategory::Batch, text, labelled ? 0.8 : 0.6);
}

std::vector<PatternMatch> PatternMatcher::extractExpiryDates(const std::string& text) const {
  bool labelled = toLower(text).find("exp") != std::string::npos;
  return sweep(PatternCategory::Expiry, text, labelled ? 0.9 : 0.7);
}

std::vector<PatternMatch> PatternMatcher::extractDrugLicenses(const std::string& text) const {
  std::string lowered = toLower(text);
  bool labelled = lowered.find("drug") != std::string::npos && lowered.find("lic") != std::string::npos;
  return sweep(PatternCategory::DrugLicense, text, labelled ? 0.9 : 0.7);
}

bool PatternMatcher::hasStrength(const std::string& text) const {
  for (const auto& re : compiledPatterns(PatternCategory::Strength)) {
    if (std::regex_search(text, re)) return true;
  }
  return false;
}

std::pair<bool, double> PatternMatcher::validateHsnPharma(const std::string& hsn) const {
  const std::string code = trim(hsn);
  if (code.empty()) return {false, 0.0};

  for (const auto& re : compiledPatterns(PatternCategory::Hsn)) {
    if (std::regex_search(code, re, std::regex_constants::match_continuous)) return {true, 0.9};
  }

  for (const char* prefix : {"3003", "3004", "2936", "2937", "2939", "2941"}) {
    if (code.rfind(prefix, 0) == 0) return {true, 0.8};
  }
  return {false, 0.0};
}
