/**
 * varnote - Main Entry Point
 *
 * Runs variant QC, HGVS notation and consequence resolution over a
 * variant file in Ensembl default format, against a local FASTA reference.
 */

#include "varnote.hpp"
#include "variant_annotator.hpp"
#include <iostream>
#include <memory>
#include <string>

void print_usage(const char* program_name) {
    std::cout << "varnote - Variant QC and HGVS Notation\n"
              << "======================================\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Reference (choose one):\n"
              << "  --fasta FILE            Reference FASTA, loaded into memory (.fa or .fa.gz)\n"
              << "  --indexed-fasta FILE    faidx-indexed FASTA, queried on disk (requires htslib)\n\n"
              << "Variant Input (choose one):\n"
              << "  -i, --input FILE        Variants in Ensembl default format:\n"
              << "                          CHR START END ALLELES STRAND [NAME] [SOURCE] [VALIDATION]\n"
              << "  -v, --variant LINE      Single variant in the same format (quoted)\n\n"
              << "Annotation Data:\n"
              << "  --transcripts FILE      Transcript table for c. notation\n"
              << "                          transcript_id gene_id seq_region strand exon_starts\n"
              << "                          exon_ends coding_start coding_end\n"
              << "  --consequences FILE     Per-transcript consequences\n"
              << "                          variant_name transcript_id gene_id TAG[,TAG]\n"
              << "                          (consequence vocabulary " << varnote::CONSEQUENCE_VOCABULARY_VERSION << ")\n\n"
              << "Output Options:\n"
              << "  -o, --output FILE       Report path (default: <input>_qc.tsv)\n"
              << "  --no-cdna               Genomic notation only\n"
              << "  --no-qc                 Skip QC checks\n"
              << "  --keep-duplicates       Keep variants whose name appears more than once\n"
              << "  --reference-name NAME   Reference name for g. notation (default: seq region)\n"
              << "  --max-allele-length N   Longest allele kept as sequence (default: 4000)\n\n"
              << "Other Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n\n"
              << "Examples:\n"
              << "  # QC and notation for a variant file\n"
              << "  " << program_name << " --fasta genome.fa -i variants.txt -o variants_qc.tsv\n\n"
              << "  # With transcript notation and consequences\n"
              << "  " << program_name << " --indexed-fasta genome.fa.gz -i variants.txt \\\n"
              << "      --transcripts transcripts.tsv --consequences consequences.tsv\n\n"
              << "  # Single variant\n"
              << "  " << program_name << " --fasta genome.fa -v \"7 140753336 140753336 A/T 1\"\n"
              << std::endl;
}

void print_annotation(const varnote::AnnotatedVariant& annotated) {
    const varnote::Variant& v = annotated.variant;

    std::cout << "\n=== Variant ===" << std::endl;
    std::cout << "location: " << v.seq_region << ":" << v.start << "-" << v.end
              << " (" << v.strand << ")" << std::endl;
    std::cout << "alleles: " << v.allele_string << std::endl;
    std::cout << "class: " << varnote::variation_class_to_string(
                     varnote::variation_class(v.allele_string)) << std::endl;

    std::string ambiguity = varnote::ambiguity_code(v.allele_string);
    if (!ambiguity.empty()) {
        std::cout << "ambiguity code: " << ambiguity << std::endl;
    }

    if (annotated.qc_checked) {
        if (annotated.qc.empty()) {
            std::cout << "qc: passed" << std::endl;
        }
        for (int code : annotated.qc.codes()) {
            std::cout << "qc: " << code << " - " << varnote::qc_failure_description(code) << std::endl;
        }
    }

    for (const auto& n : annotated.notations) {
        std::cout << "hgvs: " << n.hgvs << std::endl;
    }
    for (const auto& error : annotated.notation_errors) {
        std::cout << "notation error: " << error << std::endl;
    }

    if (annotated.consequences_resolved) {
        std::cout << "consequence: " << varnote::consequence_set_to_string(annotated.consequences)
                  << std::endl;
    }

    if (!annotated.validation_states.empty()) {
        std::cout << "validated: " << annotated.validation_states.to_string() << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string fasta_path;
    std::string indexed_fasta_path;
    std::string input_path;
    std::string variant_line;
    std::string output_path;
    std::string transcripts_path;
    std::string consequences_path;
    bool debug = false;

    varnote::AnnotatorConfig config;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--fasta" && i + 1 < argc) {
            fasta_path = argv[++i];
        } else if (arg == "--indexed-fasta" && i + 1 < argc) {
            indexed_fasta_path = argv[++i];
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input_path = argv[++i];
        } else if ((arg == "-v" || arg == "--variant") && i + 1 < argc) {
            variant_line = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--transcripts" && i + 1 < argc) {
            transcripts_path = argv[++i];
        } else if (arg == "--consequences" && i + 1 < argc) {
            consequences_path = argv[++i];
        } else if (arg == "--no-cdna") {
            config.cdna_notation = false;
        } else if (arg == "--no-qc") {
            config.run_qc = false;
        } else if (arg == "--keep-duplicates") {
            config.skip_duplicate_names = false;
        } else if (arg == "--reference-name" && i + 1 < argc) {
            config.reference_name = argv[++i];
        } else if (arg == "--max-allele-length" && i + 1 < argc) {
            auto value = varnote::parse_int(argv[++i]);
            if (!value || *value < 1) {
                std::cerr << "Error: Invalid --max-allele-length: " << argv[i] << std::endl;
                return 1;
            }
            config.max_allele_length = static_cast<size_t>(*value);
        } else if (arg == "--debug") {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Set log level
    if (debug) {
        varnote::set_log_level(varnote::LogLevel::DEBUG);
    }

    // Validate required arguments
    if (fasta_path.empty() == indexed_fasta_path.empty()) {
        std::cerr << "Error: Exactly one of --fasta and --indexed-fasta is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (input_path.empty() == variant_line.empty()) {
        std::cerr << "Error: Exactly one of --input and --variant is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Check files exist
    for (const std::string* path : {&fasta_path, &indexed_fasta_path, &input_path,
                                    &transcripts_path, &consequences_path}) {
        if (!path->empty() && !varnote::file_exists(*path)) {
            std::cerr << "Error: File not found: " << *path << std::endl;
            return 1;
        }
    }

    try {
        std::unique_ptr<varnote::SequenceProvider> reference;
        if (!fasta_path.empty()) {
            reference = std::make_unique<varnote::ReferenceGenome>(fasta_path);
        } else {
            auto indexed = std::make_unique<varnote::IndexedFastaReader>(indexed_fasta_path);
            if (!indexed->is_valid()) {
                std::cerr << "Error: Cannot open indexed FASTA: " << indexed_fasta_path << std::endl;
                return 1;
            }
            reference = std::move(indexed);
        }

        std::unique_ptr<varnote::TranscriptDatabase> transcripts;
        if (!transcripts_path.empty()) {
            transcripts = std::make_unique<varnote::TranscriptDatabase>(transcripts_path);
        }

        std::unique_ptr<varnote::ConsequenceTable> consequences;
        if (!consequences_path.empty()) {
            consequences = std::make_unique<varnote::ConsequenceTable>(
                varnote::load_consequence_table(consequences_path));
        }

        varnote::VariantAnnotator annotator(*reference, transcripts.get(), config);

        if (!variant_line.empty()) {
            auto parsed = varnote::parse_variant_line(variant_line);
            if (!parsed.valid) {
                std::cerr << "Error: Invalid variant: " << parsed.error_message << std::endl;
                return 1;
            }

            const std::vector<varnote::TranscriptConsequence> none;
            const std::vector<varnote::TranscriptConsequence>* tcs = nullptr;
            if (consequences) {
                auto it = consequences->find(parsed.variant.name);
                tcs = (it != consequences->end()) ? &it->second : &none;
            }

            print_annotation(annotator.annotate(parsed.variant, tcs));
        } else {
            if (output_path.empty()) {
                output_path = input_path + "_qc.tsv";
            }
            auto summary = varnote::annotate_variant_file(input_path, output_path, annotator,
                                                          consequences.get());
            if (summary.malformed_lines > 0) {
                std::cerr << "Warning: " << summary.malformed_lines
                          << " malformed input lines skipped" << std::endl;
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
