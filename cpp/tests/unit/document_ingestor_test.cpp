#include "rgkb/document_ingestor.hpp"
#include "rgkb/errors.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string LongDocument(char fill) {
  std::string text(100, fill);
  for (int i = 0; i < 14; ++i) {
    text += "\n\n";
    text += std::string(98, fill);
  }
  return text;
}

void ScenarioClassifyByFilename() {
  rgkb::tests::Log("scenario: classify by filename");
  using rgkb::DocumentIngestor;
  using rgkb::DocumentType;
  Require(DocumentIngestor::Classify("MAGERIT_v3.txt") == DocumentType::kRiskMethodology, "magerit");
  Require(DocumentIngestor::Classify("medicion_riesgo.txt") == DocumentType::kRiskMethodology, "medicion_riesgo");
  Require(DocumentIngestor::Classify("principios_seguridad.txt") == DocumentType::kSecurityPrinciples, "principios");
  Require(DocumentIngestor::Classify("gestion_riesgo_ti.txt") == DocumentType::kItRiskManagement, "riesgo ti");
  Require(DocumentIngestor::Classify("marco_normativo.txt") == DocumentType::kRegulatoryFramework, "marco");
  Require(DocumentIngestor::Classify("nist_framework.txt") == DocumentType::kRegulatoryFramework, "framework");
  Require(DocumentIngestor::Classify("cumplimiento.txt") == DocumentType::kCompliance, "cumplimiento");
  Require(DocumentIngestor::Classify("notas.txt") == DocumentType::kGeneral, "default must be general");
  Require(DocumentIngestor::Classify("magerit_framework.txt") == DocumentType::kRiskMethodology,
          "risk methodology must win over framework");
}

void ScenarioKeywordsAndChunkType() {
  rgkb::tests::Log("scenario: keywords and chunk type");
  using rgkb::DocumentIngestor;
  const auto keywords =
      DocumentIngestor::ExtractKeywords("El RIESGO depende de la amenaza y del activo. Metodología MAGERIT.");
  const std::vector<std::string> expected = {"magerit", "amenaza", "riesgo", "activo", "metodología"};
  Require(keywords == expected, "keywords must follow vocabulary order");

  std::string everything{};
  for (const auto& term : DocumentIngestor::SecurityVocabulary()) {
    everything += term + " ";
  }
  Require(DocumentIngestor::ExtractKeywords(everything).size() == 10, "keywords must be capped at 10");

  Require(DocumentIngestor::ClassifyChunk("una vulnerabilidad critica") == rgkb::ChunkType::kVulnerability,
          "vulnerability chunk");
  Require(DocumentIngestor::ClassifyChunk("aplicar una salvaguarda") == rgkb::ChunkType::kControl, "control chunk");
  Require(DocumentIngestor::ClassifyChunk("el impacto economico") == rgkb::ChunkType::kImpact, "impact chunk");
  Require(DocumentIngestor::ClassifyChunk("el proceso de analisis") == rgkb::ChunkType::kMethodology,
          "methodology chunk");
  Require(DocumentIngestor::ClassifyChunk("segun NIST") == rgkb::ChunkType::kFrameworkReference, "framework chunk");
  Require(DocumentIngestor::ClassifyChunk("texto general") == rgkb::ChunkType::kConceptual, "conceptual chunk");
}

void ScenarioAccentedCapitals() {
  rgkb::tests::Log("scenario: accented capitals");
  using rgkb::DocumentIngestor;
  const auto keywords = DocumentIngestor::ExtractKeywords("GESTIÓN Y ANÁLISIS DE RIESGOS");
  const std::vector<std::string> expected = {"riesgo", "análisis", "gestión"};
  Require(keywords == expected, "accented capitals must match the lowercase vocabulary");
  Require(DocumentIngestor::ExtractKeywords("EVALUACIÓN Y MITIGACIÓN") ==
              std::vector<std::string>({"evaluación", "mitigación"}),
          "evaluation and mitigation keywords");

  Require(DocumentIngestor::ClassifyChunk("MITIGACIÓN del riesgo") == rgkb::ChunkType::kControl,
          "uppercase mitigation must be a control chunk");
  Require(DocumentIngestor::ClassifyChunk("DAÑO reputacional") == rgkb::ChunkType::kImpact,
          "uppercase damage must be an impact chunk");
  Require(DocumentIngestor::ClassifyChunk("METODOLOGÍA propia") == rgkb::ChunkType::kMethodology,
          "uppercase methodology must be a methodology chunk");
  Require(DocumentIngestor::Classify("GESTIÓN_RIESGO_TI.txt") == rgkb::DocumentType::kItRiskManagement,
          "uppercase accented filename");
}

void ScenarioLoadAndSplit(const std::filesystem::path& dir) {
  rgkb::tests::Log("scenario: load and split");
  WriteFile(dir / "magerit.txt", LongDocument('m'));
  WriteFile(dir / "nested" / "principios.txt", LongDocument('p'));
  WriteFile(dir / "gestion_riesgo_ti.txt", LongDocument('g'));
  WriteFile(dir / "ignored.md", "not a knowledge document");

  const rgkb::DocumentIngestor ingestor(dir);
  const auto documents = ingestor.LoadAllDocuments();
  Require(documents.size() == 3, "only .txt files must be loaded, recursively");
  Require(documents[0].filename == "gestion_riesgo_ti.txt", "documents must be sorted by path");
  Require(documents[0].content_length == 1500, "content length mismatch");
  Require(documents[0].language == "es" && documents[0].domain == "cybersecurity", "language/domain tags");

  const auto chunks = ingestor.SplitDocuments(documents);
  Require(chunks.size() == 6, "three 1500-character documents must yield six chunks");
  const auto& second = chunks[1];
  Require(second.id == "gestion_riesgo_ti.txt_1", "chunk id must be filename_index");
  Require(second.metadata.chunk_index == 1 && second.metadata.total_chunks == 2, "chunk position metadata");
  Require(second.metadata.start_offset == 600, "start offset must point into the parent");
  Require(second.metadata.document_type == rgkb::DocumentType::kItRiskManagement, "document type inherited");
  Require(documents[0].content.compare(second.metadata.start_offset, second.text.size(), second.text) == 0,
          "chunk text must be a span of the parent");

  const auto stats = rgkb::DocumentIngestor::ComputeStats(documents);
  Require(stats.total_documents == 3 && stats.total_characters == 4500, "document stats totals");
  Require(stats.avg_document_length == 1500, "average document length");
  Require(stats.document_types.at("risk_methodology") == 1, "document type histogram");
  Require(stats.languages.count("es") == 1, "languages");
}

void ScenarioMissingDirectory(const std::filesystem::path& dir) {
  rgkb::tests::Log("scenario: missing directory");
  const rgkb::DocumentIngestor ingestor(dir / "does_not_exist");
  bool threw = false;
  try {
    (void)ingestor.LoadAllDocuments();
  } catch (const rgkb::NotFoundError&) {
    threw = true;
  }
  Require(threw, "missing directory must throw NotFoundError");
}

}  // namespace

int main() {
  try {
    rgkb::tests::Log("document_ingestor_test: start");
    rgkb::tests::TempDir dir("rgkb_ingestor_test");
    ScenarioClassifyByFilename();
    ScenarioKeywordsAndChunkType();
    ScenarioAccentedCapitals();
    ScenarioLoadAndSplit(dir.path());
    ScenarioMissingDirectory(dir.path());
    rgkb::tests::Log("document_ingestor_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    rgkb::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
