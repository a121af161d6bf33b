#include "internal/classify/individual_classifier.hpp"

#include <cassert>
#include <iostream>
#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/path_text.hpp"

namespace {

using photosift::classify::IndividualClassifier;
using photosift::classify::IndividualRule;
using photosift::classify::IndividualRuleOptions;
using photosift::classify::SiblingProbe;
using photosift::model::Decision;
using photosift::model::Photo;
using photosift::model::PhotoPath;

// Pretends exactly the listed files exist.
class FakeProbe final : public SiblingProbe {
 public:
  explicit FakeProbe(std::set<std::string> existing) : existing_(std::move(existing)) {
  }

  bool Exists(const std::string& path) const override {
    return existing_.contains(path);
  }

 private:
  std::set<std::string> existing_;
};

Photo MakePhoto(std::optional<uint32_t> width, std::optional<uint32_t> height) {
  Photo photo;
  photo.id         = "photo";
  photo.mime_type  = "image/jpeg";
  photo.size_bytes = 1000;
  photo.width      = width;
  photo.height     = height;
  return photo;
}

std::vector<PhotoPath> Paths(std::initializer_list<std::string> sources) {
  std::vector<PhotoPath> out;
  for (const auto& source : sources) {
    out.push_back({"photo", source, std::string(photosift::util::BaseName(source))});
  }
  return out;
}

IndividualClassifier Builtin(IndividualRuleOptions options = {}, std::set<std::string> existing = {}) {
  return IndividualClassifier::WithBuiltinRules(options, std::make_shared<FakeProbe>(std::move(existing)));
}

std::string RuleFor(const IndividualClassifier& classifier, const Photo& photo, const std::vector<PhotoPath>& paths) {
  auto decision = classifier.Classify(photo, paths);
  return decision ? decision->rule_name : std::string();
}

void TestTinyPhotoIsRejected() {
  auto classifier = Builtin();
  auto decision   = classifier.Classify(MakePhoto(50, 80), Paths({"/Volumes/recovered/DCIM/IMG_0001.JPG"}));
  assert(decision.has_value());
  assert(decision->decision == Decision::kReject);
  assert(decision->rule_name == "TINY_AREA");
  assert(decision->photo_id == "photo");
}

void TestOrdinaryPhotoHasNoDecision() {
  auto classifier = Builtin();
  assert(!classifier.Classify(MakePhoto(100, 100), Paths({"/Volumes/recovered/DCIM/IMG_0001.JPG"})).has_value());
}

void TestMissingDimensionsNeverMatchDimensionRules() {
  auto classifier = Builtin();
  assert(!classifier.Classify(MakePhoto(std::nullopt, std::nullopt), Paths({"/a/IMG_1.JPG"})).has_value());
  assert(!classifier.Classify(MakePhoto(std::nullopt, 10), Paths({"/Users/x/Library/Messages/Attachments/a.png"})).has_value());
  assert(!classifier.Classify(MakePhoto(std::nullopt, std::nullopt), Paths({"/x/modelresources/face.jpg"})).has_value());
}

void TestPathRulesIgnoreCase() {
  auto classifier = Builtin();
  const auto photo = MakePhoto(1024, 768);

  assert(RuleFor(classifier, photo, Paths({"/games/MineCraft/textures/stone.png"})) == "MINECRAFT_TEXTURE");
  assert(RuleFor(classifier, photo, Paths({"/Apps/hue animation/frame1.png"})) == "HUE_ANIMATION");
  assert(RuleFor(classifier, photo, Paths({"/Imports/20121223-175144/de.png"})) == "FLAG_ICON");
  assert(RuleFor(classifier, photo, Paths({"/home/u/.cache/thumb.jpg"})) == "SYSTEM_CACHE");
  assert(RuleFor(classifier, photo, Paths({"/Users/u/.Trash/old.jpg"})) == "SYSTEM_CACHE");
  assert(RuleFor(classifier, photo, Paths({"/Data/FlipShare Data/Previews/clip.jpg"})) == "FLIP_VIDEO_THUMB");
}

void TestChatIconNeedsSmallDimensions() {
  auto       classifier = Builtin();
  const auto paths      = Paths({"/Users/u/Pictures/iChat Icons/Flags/fr.gif"});

  assert(RuleFor(classifier, MakePhoto(128, 128), paths) == "CHAT_ICON");
  assert(RuleFor(classifier, MakePhoto(640, 480), paths).empty());
}

void TestWebAssetNeedsSavedPage() {
  const auto paths = Paths({"/Users/u/Desktop/Article_files/banner.jpg"});

  assert(RuleFor(Builtin(), MakePhoto(640, 480), paths).empty());
  assert(RuleFor(Builtin({}, {"/Users/u/Desktop/Article.html"}), MakePhoto(640, 480), paths) == "WEB_ASSET");
  assert(RuleFor(Builtin({}, {"/Users/u/Desktop/Article.htm"}), MakePhoto(640, 480), paths) == "WEB_ASSET");
}

void TestFaceCropNeedsSmallSquare() {
  auto       classifier = Builtin();
  const auto paths      = Paths({"/Library/Photos/modelresources/faces/123.jpg"});

  assert(RuleFor(classifier, MakePhoto(300, 320), paths) == "FACE_CROP");
  assert(RuleFor(classifier, MakePhoto(300, 450), paths).empty());
  assert(RuleFor(classifier, MakePhoto(600, 600), paths).empty());
}

void TestStockGreetingUsesThreeDigitStem() {
  auto       classifier = Builtin();
  const auto photo      = MakePhoto(1024, 768);

  assert(RuleFor(classifier, photo, Paths({"/Cards/Thumbnails/123.jpg"})) == "STOCK_GREETING");
  assert(RuleFor(classifier, photo, Paths({"/Cards/Thumbnails/045_1024.jpg"})) == "STOCK_GREETING");
  assert(RuleFor(classifier, photo, Paths({"/Cards/Thumbnails/1234.jpg"})).empty());
  assert(RuleFor(classifier, photo, Paths({"/Cards/Other/123.jpg"})).empty());
}

void TestConfiguredPathSubstrings() {
  IndividualRuleOptions options;
  options.reject_path_substrings   = {"/Junk Drawer/"};
  options.separate_path_substrings = {"/tor/Pictures/2013/03/03/"};
  auto classifier                  = Builtin(options);
  const auto photo                 = MakePhoto(1024, 768);

  assert(RuleFor(classifier, photo, Paths({"/home/junk drawer/a.jpg"})) == "CUSTOM_PATH_REJECT");

  auto separated = classifier.Classify(photo, Paths({"/Users/tor/Pictures/2013/03/03/a.jpg"}));
  assert(separated && separated->decision == Decision::kSeparate && separated->rule_name == "SEPARATE_PATH");
}

void TestRejectionWinsOverSeparation() {
  auto classifier = Builtin();

  // Photo Booth library path would separate, but the photo is tiny
  auto decision = classifier.Classify(MakePhoto(40, 40), Paths({"/Users/u/Pictures/Photo Booth Library/Pictures/p1.jpg"}));
  assert(decision && decision->decision == Decision::kReject && decision->rule_name == "TINY_AREA");

  auto booth = classifier.Classify(MakePhoto(640, 480), Paths({"/Users/u/Pictures/Photo Booth Library/Originals/p1.jpg"}));
  assert(booth && booth->decision == Decision::kSeparate && booth->rule_name == "PHOTOBOOTH");
}

void TestFirstMatchingRuleWinsAndLaterRulesAreNotEvaluated() {
  int later_calls = 0;

  std::vector<IndividualRule> rejection = {
      {"FIRST", Decision::kReject, [](const Photo&, const std::vector<PhotoPath>&) { return true; }},
      {"SECOND", Decision::kReject, [&later_calls](const Photo&, const std::vector<PhotoPath>&) {
         ++later_calls;
         return true;
       }},
  };
  IndividualClassifier classifier(std::move(rejection), {});

  auto decision = classifier.Classify(MakePhoto(10, 10), {});
  assert(decision && decision->rule_name == "FIRST");
  assert(later_calls == 0);
}

void TestBuiltinRuleOrder() {
  auto classifier = Builtin();

  const std::vector<std::string> expected = {"TINY_AREA",      "MINECRAFT_TEXTURE", "HUE_ANIMATION", "CHAT_ICON",        "WEB_ASSET",         "FACE_CROP",
                                             "STOCK_GREETING", "FLAG_ICON",         "SYSTEM_CACHE",  "FLIP_VIDEO_THUMB", "CUSTOM_PATH_REJECT"};
  assert(classifier.rejection_rules().size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(classifier.rejection_rules()[i].name == expected[i]);
  }
  assert(classifier.separation_rules().size() == 2);
  assert(classifier.separation_rules()[0].name == "PHOTOBOOTH");
  assert(classifier.separation_rules()[1].name == "SEPARATE_PATH");
}

void TestThrowingRuleIsReportedNotSkipped() {
  std::vector<IndividualRule> rejection = {
      {"BROKEN", Decision::kReject, [](const Photo&, const std::vector<PhotoPath>&) -> bool { throw std::out_of_range("bad index"); }},
  };
  IndividualClassifier classifier(std::move(rejection), {});

  bool threw = false;
  try {
    (void)classifier.Classify(MakePhoto(10, 10), {});
  } catch (const photosift::util::RuleEvaluationError& e) {
    threw = true;
    assert(e.rule_name() == "BROKEN");
    assert(e.photo_id() == "photo");
  }
  assert(threw);
}

void TestMisplacedRulesAreRejectedAtConstruction() {
  bool threw = false;
  try {
    IndividualClassifier classifier({{"WRONG", Decision::kSeparate, [](const Photo&, const std::vector<PhotoPath>&) { return false; }}}, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    IndividualClassifier classifier({{"EMPTY", Decision::kReject, nullptr}}, {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestClassificationIsIndependentOfEvaluationOrder() {
  auto       classifier = Builtin();
  const auto tiny       = MakePhoto(10, 10);
  const auto normal     = MakePhoto(800, 600);
  const auto paths      = Paths({"/DCIM/IMG_2.JPG"});

  const auto first  = RuleFor(classifier, normal, paths);
  (void)classifier.Classify(tiny, paths);
  const auto second = RuleFor(classifier, normal, paths);
  assert(first == second);
}

} // namespace

int main() {
  TestTinyPhotoIsRejected();
  TestOrdinaryPhotoHasNoDecision();
  TestMissingDimensionsNeverMatchDimensionRules();
  TestPathRulesIgnoreCase();
  TestChatIconNeedsSmallDimensions();
  TestWebAssetNeedsSavedPage();
  TestFaceCropNeedsSmallSquare();
  TestStockGreetingUsesThreeDigitStem();
  TestConfiguredPathSubstrings();
  TestRejectionWinsOverSeparation();
  TestFirstMatchingRuleWinsAndLaterRulesAreNotEvaluated();
  TestBuiltinRuleOrder();
  TestThrowingRuleIsReportedNotSkipped();
  TestMisplacedRulesAreRejectedAtConstruction();
  TestClassificationIsIndependentOfEvaluationOrder();

  std::cout << "photosift_unit_individual_classifier: pass\n";
  return 0;
}
