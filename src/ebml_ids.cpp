//
//  ebml_ids.cpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ebml_ids.hpp"

#include <algorithm>
#include <array>

namespace cadencefix {

namespace {

struct ElementEntry {
    ElementId id;
    const char *name;
};

// Sorted by identifier value for binary search.
constexpr std::array<ElementEntry, 225> kElementTable = {{
    {ElementId::ChapterDisplay, "ChapterDisplay"},
    {ElementId::TrackType, "TrackType"},
    {ElementId::ChapString, "ChapString"},
    {ElementId::CodecID, "CodecID"},
    {ElementId::FlagDefault, "FlagDefault"},
    {ElementId::ChapterTrackNumber, "ChapterTrackNumber"},
    {ElementId::Slices, "Slices"},
    {ElementId::ChapterTrack, "ChapterTrack"},
    {ElementId::ChapterTimeStart, "ChapterTimeStart"},
    {ElementId::ChapterTimeEnd, "ChapterTimeEnd"},
    {ElementId::CueRefTime, "CueRefTime"},
    {ElementId::CueRefCluster, "CueRefCluster"},
    {ElementId::ChapterFlagHidden, "ChapterFlagHidden"},
    {ElementId::FlagInterlaced, "FlagInterlaced"},
    {ElementId::BlockDuration, "BlockDuration"},
    {ElementId::FlagLacing, "FlagLacing"},
    {ElementId::Channels, "Channels"},
    {ElementId::BlockGroup, "BlockGroup"},
    {ElementId::Block, "Block"},
    {ElementId::BlockVirtual, "BlockVirtual"},
    {ElementId::SimpleBlock, "SimpleBlock"},
    {ElementId::CodecState, "CodecState"},
    {ElementId::BlockAdditional, "BlockAdditional"},
    {ElementId::BlockMore, "BlockMore"},
    {ElementId::Position, "Position"},
    {ElementId::CodecDecodeAll, "CodecDecodeAll"},
    {ElementId::PrevSize, "PrevSize"},
    {ElementId::TrackEntry, "TrackEntry"},
    {ElementId::EncryptedBlock, "EncryptedBlock"},
    {ElementId::PixelWidth, "PixelWidth"},
    {ElementId::CueDuration, "CueDuration"},
    {ElementId::CueTime, "CueTime"},
    {ElementId::SamplingFrequency, "SamplingFrequency"},
    {ElementId::ChapterAtom, "ChapterAtom"},
    {ElementId::CueTrackPositions, "CueTrackPositions"},
    {ElementId::FlagEnabled, "FlagEnabled"},
    {ElementId::PixelHeight, "PixelHeight"},
    {ElementId::CuePoint, "CuePoint"},
    {ElementId::CRC32, "CRC-32"},
    {ElementId::TrickTrackUID, "TrickTrackUID"},
    {ElementId::TrickTrackSegmentUID, "TrickTrackSegmentUID"},
    {ElementId::TrickMasterTrackSegmentUID, "TrickMasterTrackSegmentUID"},
    {ElementId::TrickTrackFlag, "TrickTrackFlag"},
    {ElementId::TrickMasterTrackUID, "TrickMasterTrackUID"},
    {ElementId::ReferenceFrame, "ReferenceFrame"},
    {ElementId::ReferenceOffset, "ReferenceOffset"},
    {ElementId::ReferenceTimeCode, "ReferenceTimeCode"},
    {ElementId::BlockAdditionID, "BlockAdditionID"},
    {ElementId::LaceNumber, "LaceNumber"},
    {ElementId::FrameNumber, "FrameNumber"},
    {ElementId::Delay, "Delay"},
    {ElementId::SliceDuration, "SliceDuration"},
    {ElementId::TrackNumber, "TrackNumber"},
    {ElementId::CueReference, "CueReference"},
    {ElementId::Video, "Video"},
    {ElementId::Audio, "Audio"},
    {ElementId::TrackOperation, "TrackOperation"},
    {ElementId::TrackCombinePlanes, "TrackCombinePlanes"},
    {ElementId::TrackPlane, "TrackPlane"},
    {ElementId::TrackPlaneUID, "TrackPlaneUID"},
    {ElementId::TrackPlaneType, "TrackPlaneType"},
    {ElementId::Timecode, "Timecode"},
    {ElementId::TimeSlice, "TimeSlice"},
    {ElementId::TrackJoinBlocks, "TrackJoinBlocks"},
    {ElementId::CueCodecState, "CueCodecState"},
    {ElementId::CueRefCodecState, "CueRefCodecState"},
    {ElementId::Void, "Void"},
    {ElementId::TrackJoinUID, "TrackJoinUID"},
    {ElementId::BlockAddID, "BlockAddID"},
    {ElementId::CueRelativePosition, "CueRelativePosition"},
    {ElementId::CueClusterPosition, "CueClusterPosition"},
    {ElementId::CueTrack, "CueTrack"},
    {ElementId::ReferencePriority, "ReferencePriority"},
    {ElementId::ReferenceBlock, "ReferenceBlock"},
    {ElementId::ReferenceVirtual, "ReferenceVirtual"},
    {ElementId::ContentCompAlgo, "ContentCompAlgo"},
    {ElementId::ContentCompSettings, "ContentCompSettings"},
    {ElementId::DocType, "DocType"},
    {ElementId::DocTypeReadVersion, "DocTypeReadVersion"},
    {ElementId::EBMLVersion, "EBMLVersion"},
    {ElementId::DocTypeVersion, "DocTypeVersion"},
    {ElementId::EBMLMaxIDLength, "EBMLMaxIDLength"},
    {ElementId::EBMLMaxSizeLength, "EBMLMaxSizeLength"},
    {ElementId::EBMLReadVersion, "EBMLReadVersion"},
    {ElementId::ChapLanguage, "ChapLanguage"},
    {ElementId::ChapCountry, "ChapCountry"},
    {ElementId::SegmentFamily, "SegmentFamily"},
    {ElementId::DateUTC, "DateUTC"},
    {ElementId::TagLanguage, "TagLanguage"},
    {ElementId::TagDefault, "TagDefault"},
    {ElementId::TagBinary, "TagBinary"},
    {ElementId::TagString, "TagString"},
    {ElementId::Duration, "Duration"},
    {ElementId::ChapProcessPrivate, "ChapProcessPrivate"},
    {ElementId::ChapterFlagEnabled, "ChapterFlagEnabled"},
    {ElementId::TagName, "TagName"},
    {ElementId::EditionEntry, "EditionEntry"},
    {ElementId::EditionUID, "EditionUID"},
    {ElementId::EditionFlagHidden, "EditionFlagHidden"},
    {ElementId::EditionFlagDefault, "EditionFlagDefault"},
    {ElementId::EditionFlagOrdered, "EditionFlagOrdered"},
    {ElementId::FileData, "FileData"},
    {ElementId::FileMimeType, "FileMimeType"},
    {ElementId::FileUsedStartTime, "FileUsedStartTime"},
    {ElementId::FileUsedEndTime, "FileUsedEndTime"},
    {ElementId::FileName, "FileName"},
    {ElementId::FileReferral, "FileReferral"},
    {ElementId::FileDescription, "FileDescription"},
    {ElementId::FileUID, "FileUID"},
    {ElementId::ContentEncAlgo, "ContentEncAlgo"},
    {ElementId::ContentEncKeyID, "ContentEncKeyID"},
    {ElementId::ContentSignature, "ContentSignature"},
    {ElementId::ContentSigKeyID, "ContentSigKeyID"},
    {ElementId::ContentSigAlgo, "ContentSigAlgo"},
    {ElementId::ContentSigHashAlgo, "ContentSigHashAlgo"},
    {ElementId::MuxingApp, "MuxingApp"},
    {ElementId::Seek, "Seek"},
    {ElementId::ContentEncodingOrder, "ContentEncodingOrder"},
    {ElementId::ContentEncodingScope, "ContentEncodingScope"},
    {ElementId::ContentEncodingType, "ContentEncodingType"},
    {ElementId::ContentCompression, "ContentCompression"},
    {ElementId::ContentEncryption, "ContentEncryption"},
    {ElementId::CueRefNumber, "CueRefNumber"},
    {ElementId::Name, "Name"},
    {ElementId::CueBlockNumber, "CueBlockNumber"},
    {ElementId::TrackOffset, "TrackOffset"},
    {ElementId::SeekID, "SeekID"},
    {ElementId::SeekPosition, "SeekPosition"},
    {ElementId::StereoMode, "StereoMode"},
    {ElementId::OldStereoMode, "OldStereoMode"},
    {ElementId::AlphaMode, "AlphaMode"},
    {ElementId::PixelCropBottom, "PixelCropBottom"},
    {ElementId::DisplayWidth, "DisplayWidth"},
    {ElementId::DisplayUnit, "DisplayUnit"},
    {ElementId::AspectRatioType, "AspectRatioType"},
    {ElementId::DisplayHeight, "DisplayHeight"},
    {ElementId::PixelCropTop, "PixelCropTop"},
    {ElementId::PixelCropLeft, "PixelCropLeft"},
    {ElementId::PixelCropRight, "PixelCropRight"},
    {ElementId::FlagForced, "FlagForced"},
    {ElementId::MaxBlockAdditionID, "MaxBlockAdditionID"},
    {ElementId::ChapterStringUID, "ChapterStringUID"},
    {ElementId::CodecDelay, "CodecDelay"},
    {ElementId::SeekPreRoll, "SeekPreRoll"},
    {ElementId::WritingApp, "WritingApp"},
    {ElementId::SilentTracks, "SilentTracks"},
    {ElementId::SilentTrackNumber, "SilentTrackNumber"},
    {ElementId::AttachedFile, "AttachedFile"},
    {ElementId::ContentEncoding, "ContentEncoding"},
    {ElementId::BitDepth, "BitDepth"},
    {ElementId::CodecPrivate, "CodecPrivate"},
    {ElementId::Targets, "Targets"},
    {ElementId::ChapterPhysicalEquiv, "ChapterPhysicalEquiv"},
    {ElementId::TagChapterUID, "TagChapterUID"},
    {ElementId::TagTrackUID, "TagTrackUID"},
    {ElementId::TagAttachmentUID, "TagAttachmentUID"},
    {ElementId::TagEditionUID, "TagEditionUID"},
    {ElementId::TargetType, "TargetType"},
    {ElementId::SignedElement, "SignedElement"},
    {ElementId::TrackTranslate, "TrackTranslate"},
    {ElementId::TrackTranslateTrackID, "TrackTranslateTrackID"},
    {ElementId::TrackTranslateCodec, "TrackTranslateCodec"},
    {ElementId::TrackTranslateEditionUID, "TrackTranslateEditionUID"},
    {ElementId::SimpleTag, "SimpleTag"},
    {ElementId::TargetTypeValue, "TargetTypeValue"},
    {ElementId::ChapProcessCommand, "ChapProcessCommand"},
    {ElementId::ChapProcessTime, "ChapProcessTime"},
    {ElementId::ChapterTranslate, "ChapterTranslate"},
    {ElementId::ChapProcessData, "ChapProcessData"},
    {ElementId::ChapProcess, "ChapProcess"},
    {ElementId::ChapProcessCodecID, "ChapProcessCodecID"},
    {ElementId::ChapterTranslateID, "ChapterTranslateID"},
    {ElementId::ChapterTranslateCodec, "ChapterTranslateCodec"},
    {ElementId::ChapterTranslateEditionUID, "ChapterTranslateEditionUID"},
    {ElementId::ContentEncodings, "ContentEncodings"},
    {ElementId::MinCache, "MinCache"},
    {ElementId::MaxCache, "MaxCache"},
    {ElementId::ChapterSegmentUID, "ChapterSegmentUID"},
    {ElementId::ChapterSegmentEditionUID, "ChapterSegmentEditionUID"},
    {ElementId::TrackOverlay, "TrackOverlay"},
    {ElementId::Tag, "Tag"},
    {ElementId::SegmentFilename, "SegmentFilename"},
    {ElementId::SegmentUID, "SegmentUID"},
    {ElementId::ChapterUID, "ChapterUID"},
    {ElementId::TrackUID, "TrackUID"},
    {ElementId::AttachmentLink, "AttachmentLink"},
    {ElementId::BlockAdditions, "BlockAdditions"},
    {ElementId::DiscardPadding, "DiscardPadding"},
    {ElementId::OutputSamplingFrequency, "OutputSamplingFrequency"},
    {ElementId::Title, "Title"},
    {ElementId::ChannelPositions, "ChannelPositions"},
    {ElementId::SignatureElements, "SignatureElements"},
    {ElementId::SignatureElementList, "SignatureElementList"},
    {ElementId::SignatureAlgo, "SignatureAlgo"},
    {ElementId::SignatureHash, "SignatureHash"},
    {ElementId::SignaturePublicKey, "SignaturePublicKey"},
    {ElementId::Signature, "Signature"},
    {ElementId::Language, "Language"},
    {ElementId::TrackTimecodeScale, "TrackTimecodeScale"},
    {ElementId::DefaultDecodedFieldDuration, "DefaultDecodedFieldDuration"},
    {ElementId::FrameRate, "FrameRate"},
    {ElementId::DefaultDuration, "DefaultDuration"},
    {ElementId::CodecName, "CodecName"},
    {ElementId::CodecDownloadURL, "CodecDownloadURL"},
    {ElementId::TimecodeScale, "TimecodeScale"},
    {ElementId::TimecodeScaleDenominator, "TimecodeScaleDenominator"},
    {ElementId::ColourSpace, "ColourSpace"},
    {ElementId::GammaValue, "GammaValue"},
    {ElementId::CodecSettings, "CodecSettings"},
    {ElementId::CodecInfoURL, "CodecInfoURL"},
    {ElementId::PrevFilename, "PrevFilename"},
    {ElementId::PrevUID, "PrevUID"},
    {ElementId::NextFilename, "NextFilename"},
    {ElementId::NextUID, "NextUID"},
    {ElementId::Chapters, "Chapters"},
    {ElementId::SeekHead, "SeekHead"},
    {ElementId::Tags, "Tags"},
    {ElementId::Info, "Info"},
    {ElementId::Tracks, "Tracks"},
    {ElementId::Segment, "Segment"},
    {ElementId::Attachments, "Attachments"},
    {ElementId::EBML, "EBML"},
    {ElementId::SignatureSlot, "SignatureSlot"},
    {ElementId::Cues, "Cues"},
    {ElementId::Cluster, "Cluster"},
}};

}  // namespace

std::optional<ElementId> lookup_element_id(uint32_t raw_id) {
    auto it = std::lower_bound(kElementTable.begin(), kElementTable.end(), raw_id,
                               [](const ElementEntry &e, uint32_t v) {
                                   return static_cast<uint32_t>(e.id) < v;
                               });
    if (it == kElementTable.end() || static_cast<uint32_t>(it->id) != raw_id) {
        return std::nullopt;
    }
    return it->id;
}

const char *element_name(ElementId id) {
    auto it = std::lower_bound(kElementTable.begin(), kElementTable.end(),
                               static_cast<uint32_t>(id), [](const ElementEntry &e, uint32_t v) {
                                   return static_cast<uint32_t>(e.id) < v;
                               });
    if (it == kElementTable.end() || it->id != id) {
        return "?";
    }
    return it->name;
}

size_t element_table_size() { return kElementTable.size(); }

}  // namespace cadencefix
